#ifndef RELAY_TYPES_VALUE_H
#define RELAY_TYPES_VALUE_H

#include <relay/relay_base.h>
#include <relay/util/errors.h>
#include <relay/util/string_utils.h>

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace relay {
    /**
     * Marker returned from a callback (or placed in one slot of its results) to skip writing a particular output
     * without failing the rest of the dispatch.
     */
    struct NoUpdate {
        friend bool operator==(NoUpdate, NoUpdate) { return true; }
    };

    inline constexpr NoUpdate no_update{};

    /**
     * Base for arbitrary payloads carried in a Value, compared by identity.
     */
    struct RELAY_EXPORT Object {
        virtual ~Object() = default;

        [[nodiscard]] virtual std::string to_string() const;
    };

    /**
     * Base for stateless announcements (button presses, key events...) sent by a component.
     * The dynamic type of the event is what Published dependencies match on.
     */
    struct RELAY_EXPORT Event : Object {
    };

    /**
     * Dynamically typed value used for component properties, callback arguments and callback results.
     */
    class RELAY_EXPORT Value {
    public:
        using List = std::vector<Value>;
        using storage_type = std::variant<std::monostate, NoUpdate, bool, int64_t, double, std::string, List,
            object_ptr>;

        Value() = default;

        Value(std::nullptr_t) {}

        Value(NoUpdate value) : _storage{value} {}

        Value(bool value) : _storage{value} {}

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        Value(T value) : _storage{static_cast<int64_t>(value)} {}

        template<std::floating_point T>
        Value(T value) : _storage{static_cast<double>(value)} {}

        Value(std::string value) : _storage{std::move(value)} {}

        Value(std::string_view value) : _storage{std::string{value}} {}

        Value(const char *value) : _storage{std::string{value}} {}

        Value(List value) : _storage{std::move(value)} {}

        template<typename T>
            requires std::derived_from<std::remove_cv_t<T>, Object>
        Value(std::shared_ptr<T> value) : _storage{object_ptr{std::move(value)}} {}

        template<typename... Ts>
        static Value list(Ts &&... values) {
            List items;
            items.reserve(sizeof...(Ts));
            (items.emplace_back(std::forward<Ts>(values)), ...);
            return Value{std::move(items)};
        }

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(_storage); }

        [[nodiscard]] bool is_no_update() const { return std::holds_alternative<NoUpdate>(_storage); }

        [[nodiscard]] bool is_list() const { return std::holds_alternative<List>(_storage); }

        template<typename T>
        [[nodiscard]] bool is() const { return std::holds_alternative<T>(_storage); }

        template<typename T>
        [[nodiscard]] const T &as() const {
            if (const auto *value = std::get_if<T>(&_storage)) { return *value; }
            throw_error<bad_expected_type<T> >(type_name(), relay::type_name(typeid(T)));
        }

        /**
         * The payload as a specific Object type, throws if the value is not an object of that type.
         */
        template<typename T>
            requires std::derived_from<T, Object>
        [[nodiscard]] std::shared_ptr<const T> as_object() const {
            if (const auto *value = std::get_if<object_ptr>(&_storage)) {
                if (auto object = std::dynamic_pointer_cast<const T>(*value)) { return object; }
            }
            throw_error<bad_expected_type<T> >(type_name(), relay::type_name(typeid(T)));
        }

        [[nodiscard]] const storage_type &storage() const { return _storage; }

        /**
         * Name of the type currently held, for diagnostics.
         */
        [[nodiscard]] std::string type_name() const;

        [[nodiscard]] std::string to_string() const;

        friend RELAY_EXPORT bool operator==(const Value &lhs, const Value &rhs);

    private:
        storage_type _storage;
    };
} // namespace relay

template<>
struct fmt::formatter<relay::Value> : fmt::formatter<std::string_view> {
    auto format(const relay::Value &value, fmt::format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};

#endif // RELAY_TYPES_VALUE_H
