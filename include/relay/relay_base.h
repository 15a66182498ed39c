/*
 * The core imports for relay. Use this to ensure the correct import order can be maintained.
 */

#ifndef RELAY_BASE_H
#define RELAY_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <relay/relay_export.h>
#include <relay/relay_forward_declarations.h>

#include <ankerl/unordered_dense.h>

#include <string>
#include <string_view>

namespace relay {
    /**
     * Transparent hash for string keyed indexes, allows lookups with std::string_view without allocating.
     */
    struct string_hash {
        using is_transparent = void;
        using is_avalanching = void;

        [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
            return ankerl::unordered_dense::hash<std::string_view>{}(str);
        }
    };

    template<typename V>
    using string_map = ankerl::unordered_dense::map<std::string, V, string_hash, std::equal_to<>>;
} // namespace relay

#endif //RELAY_BASE_H
