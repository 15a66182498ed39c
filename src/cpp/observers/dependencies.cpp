#include <relay/observers/dependencies.h>

#include <unordered_set>

namespace relay {
    std::string resolve_component_id(std::string_view component_id, std::string_view component_property) {
        if (component_id.empty()) {
            throw_error<MissingComponentId>("Cannot observe '{}' of a component without an id", component_property);
        }
        return std::string{component_id};
    }

    Dependency::Dependency(std::string component_id, std::string component_property)
        : _component_id{std::move(component_id)}, _component_property{std::move(component_property)} {
    }

    std::string Dependency::key() const { return fmt::format("{}@{}", _component_id, _component_property); }

    bool Dependency::matches(std::string_view component_id, std::string_view component_property) const {
        return _component_id == component_id && _component_property == component_property;
    }

    bool operator==(const Dependency &lhs, const Dependency &rhs) {
        return lhs._component_id == rhs._component_id && lhs._component_property == rhs._component_property;
    }

    Published::Published(std::string component_id, const std::type_info &event_type)
        : Published(std::move(component_id), type_name(event_type), std::type_index(event_type)) {
    }

    Published::Published(std::string component_id, std::string component_property, std::type_index event_type)
        : Dependency(std::move(component_id), std::move(component_property)), _event_type{event_type} {
    }

    Raised::Raised(const std::type_info &error_type)
        : Published(std::string{CALLBACK_EXCEPTION_ID}, type_name(error_type), std::type_index(error_type)) {
    }

    bool FlattenedDependencies::has_triggers() const {
        return !publications.empty() || !raised.empty() || !modifications.empty();
    }

    FlattenedDependencies flatten_dependencies(std::span<const AnyDependency> dependencies) {
        FlattenedDependencies flattened;
        for (const auto &dependency: dependencies) {
            std::visit([&flattened]<typename D>(const D &dep) {
                if constexpr (std::is_same_v<D, Published>) {
                    flattened.publications.push_back(dep);
                } else if constexpr (std::is_same_v<D, Raised>) {
                    flattened.raised.push_back(dep);
                } else if constexpr (std::is_same_v<D, Modified>) {
                    flattened.modifications.push_back(dep);
                } else if constexpr (std::is_same_v<D, Select>) {
                    flattened.selections.push_back(dep);
                } else {
                    flattened.updates.push_back(dep);
                }
            }, dependency);
        }
        return flattened;
    }

    void validate_dependencies(std::span<const AnyDependency> dependencies) {
        auto flattened = flatten_dependencies(dependencies);
        if (!flattened.has_triggers()) { throw_error<std::invalid_argument>("No trigger dependency found"); }
        if (!flattened.raised.empty() && (!flattened.publications.empty() || !flattened.modifications.empty())) {
            throw_error<std::invalid_argument>(
                "No other triggering input dependencies are allowed with exception handlers, only Selects");
        }
        std::unordered_set<Dependency> triggers;
        auto check = [&triggers](const Dependency &dependency) {
            if (!triggers.insert(dependency).second) {
                throw_error<std::invalid_argument>("Duplicate trigger dependency found for {}:{}",
                                                   dependency.component_id(), dependency.component_property());
            }
        };
        for (const auto &dep: flattened.publications) { check(dep); }
        for (const auto &dep: flattened.modifications) { check(dep); }
    }

    std::string describe(const AnyDependency &dependency) {
        return std::visit([](const auto &dep) { return describe(dep); }, dependency);
    }

    const Dependency &as_dependency(const AnyDependency &dependency) {
        return std::visit([](const auto &dep) -> const Dependency & { return dep; }, dependency);
    }
} // namespace relay
