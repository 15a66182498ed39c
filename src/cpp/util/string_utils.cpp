#include <relay/util/string_utils.h>

#include <fmt/format.h>

#include <cxxabi.h>
#include <cstdlib>
#include <memory>

namespace relay {
    template<>
    std::string to_string(const bool &value) { return value ? "true" : "false"; }

    template<>
    std::string to_string(const int64_t &value) { return std::to_string(value); }

    template<>
    std::string to_string(const double &value) { return fmt::format("{}", value); }

    std::string type_name(const std::type_info &type) {
        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> demangled{
            abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), &std::free
        };
        if (status == 0 && demangled) { return demangled.get(); }
        return type.name();
    }
} // namespace relay
