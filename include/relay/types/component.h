#ifndef RELAY_TYPES_COMPONENT_H
#define RELAY_TYPES_COMPONENT_H

#include <relay/types/value.h>

#include <concepts>

namespace relay {
    /**
     * Anything that exposes an id usable in dependencies, e.g. a component or widget.
     */
    template<typename T>
    concept SupportsId = requires(const T &component) {
        { component.id() } -> std::convertible_to<std::string_view>;
    };

    /**
     * The view of a host component used by the default observer hooks: an id, and named properties that can be read
     * and written.
     */
    struct RELAY_EXPORT Component {
        virtual ~Component() = default;

        [[nodiscard]] virtual const std::string &id() const = 0;

        /**
         * Current value of a property, throws UnknownProperty if the component has no such property.
         */
        [[nodiscard]] virtual Value property(std::string_view name) const = 0;

        virtual void set_property(std::string_view name, Value value) = 0;
    };
} // namespace relay

#endif // RELAY_TYPES_COMPONENT_H
