#ifndef RELAY_UTIL_STRING_UTILS_H
#define RELAY_UTIL_STRING_UTILS_H

#include <cstdint>
#include <string>
#include <typeinfo>

namespace relay {
    template<typename T>
    std::string to_string(const T &value);

    template<>
    std::string to_string(const bool &value);

    template<>
    std::string to_string(const int64_t &value);

    template<>
    std::string to_string(const double &value);

    /**
     * Human readable, stable, name of a type, e.g. ``relay::PreventUpdate``.
     * Used as the property of event and error dependencies, so the same type always produces the same name.
     */
    std::string type_name(const std::type_info &type);
} // namespace relay

#endif  // RELAY_UTIL_STRING_UTILS_H
