#ifndef RELAY_OBSERVERS_DEPENDENCIES_H
#define RELAY_OBSERVERS_DEPENDENCIES_H

#include <relay/observers/exceptions.h>
#include <relay/types/component.h>

#include <span>
#include <typeindex>
#include <typeinfo>
#include <variant>

namespace relay {
    /**
     * Id used by Raised dependencies, errors are announced as if published by this component.
     */
    inline constexpr std::string_view CALLBACK_EXCEPTION_ID = "_callback_exception_id";

    /**
     * Resolve the id of an id-bearing object eagerly, an empty id cannot be used to route updates.
     */
    [[nodiscard]] RELAY_EXPORT std::string resolve_component_id(std::string_view component_id,
                                                                std::string_view component_property);

    /**
     * Base for all observation dependencies: a property (or event/error type) of a component, identified by id.
     * Equality and hashing only consider the id and the property, whatever the kind of dependency.
     */
    struct RELAY_EXPORT Dependency {
        static constexpr std::string_view kind = "Dependency";

        Dependency(std::string component_id, std::string component_property);

        Dependency(const char *component_id, std::string component_property)
            : Dependency(std::string{component_id}, std::move(component_property)) {}

        template<SupportsId T>
            requires (!std::convertible_to<const T &, std::string>)
        Dependency(const T &component, std::string_view component_property)
            : Dependency(resolve_component_id(component.id(), component_property), std::string{component_property}) {}

        [[nodiscard]] const std::string &component_id() const { return _component_id; }

        [[nodiscard]] const std::string &component_property() const { return _component_property; }

        /**
         * ``id@property``, the form used to build observer ids.
         */
        [[nodiscard]] std::string key() const;

        /**
         * True when this dependency refers to the given component property.
         */
        [[nodiscard]] bool matches(std::string_view component_id, std::string_view component_property) const;

        friend RELAY_EXPORT bool operator==(const Dependency &lhs, const Dependency &rhs);

    private:
        std::string _component_id;
        std::string _component_property;
    };

    /**
     * Triggering input of an observation callback based on a stateful property update.
     */
    struct RELAY_EXPORT Modified : Dependency {
        static constexpr std::string_view kind = "Modified";

        using Dependency::Dependency;
    };

    /**
     * Triggering input of an observation callback based on a stateless event rather than a stateful property.
     * The property is the name of the event type, the argument is the event itself when it is the trigger.
     */
    struct RELAY_EXPORT Published : Dependency {
        static constexpr std::string_view kind = "Published";

        Published(std::string component_id, const std::type_info &event_type);

        Published(const char *component_id, const std::type_info &event_type)
            : Published(std::string{component_id}, event_type) {}

        template<SupportsId T>
            requires (!std::convertible_to<const T &, std::string>)
        Published(const T &component, const std::type_info &event_type)
            : Published(resolve_component_id(component.id(), type_name(event_type)), event_type) {}

        [[nodiscard]] std::type_index event_type() const { return _event_type; }

    protected:
        Published(std::string component_id, std::string component_property, std::type_index event_type);

    private:
        std::type_index _event_type;
    };

    /**
     * Triggering input of an observation callback based on an error raised by another callback.
     *
     * Only errors raised by the callback itself are announced, not errors raised while collecting arguments or
     * applying updates. The error type must match the dynamic type of the raised error exactly.
     */
    struct RELAY_EXPORT Raised : Published {
        static constexpr std::string_view kind = "Raised";

        explicit Raised(const std::type_info &error_type);
    };

    /**
     * Non-triggering input of an observation callback: the most recent property value.
     */
    struct RELAY_EXPORT Select : Dependency {
        static constexpr std::string_view kind = "Select";

        using Dependency::Dependency;
    };

    /**
     * Output of an observation callback: the property updated with the callback result.
     */
    struct RELAY_EXPORT Update : Dependency {
        static constexpr std::string_view kind = "Update";

        using Dependency::Dependency;
    };

    using AnyDependency = std::variant<Modified, Published, Raised, Select, Update>;

    /**
     * Dependencies split by kind, each list keeps the order in which its dependencies were declared.
     */
    struct RELAY_EXPORT FlattenedDependencies {
        std::vector<Published> publications;
        std::vector<Raised> raised;
        std::vector<Modified> modifications;
        std::vector<Select> selections;
        std::vector<Update> updates;

        [[nodiscard]] bool has_triggers() const;
    };

    [[nodiscard]] RELAY_EXPORT FlattenedDependencies flatten_dependencies(std::span<const AnyDependency> dependencies);

    /**
     * Check the dependencies form a valid callback, throws std::invalid_argument if:
     * - there is no triggering dependency,
     * - the same trigger is declared twice,
     * - an error trigger is combined with property or event triggers.
     */
    RELAY_EXPORT void validate_dependencies(std::span<const AnyDependency> dependencies);

    template<typename D>
        requires std::derived_from<D, Dependency>
    [[nodiscard]] std::string describe(const D &dependency) {
        return fmt::format("{}('{}', '{}')", D::kind, dependency.component_id(), dependency.component_property());
    }

    [[nodiscard]] RELAY_EXPORT std::string describe(const AnyDependency &dependency);

    [[nodiscard]] RELAY_EXPORT const Dependency &as_dependency(const AnyDependency &dependency);
} // namespace relay

template<>
struct std::hash<relay::Dependency> {
    std::size_t operator()(const relay::Dependency &dependency) const noexcept {
        return ankerl::unordered_dense::hash<std::string>{}(dependency.key());
    }
};

#endif // RELAY_OBSERVERS_DEPENDENCIES_H
