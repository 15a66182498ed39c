#include <relay/observers/observer_registry.h>

namespace relay {
    namespace {
        const ObserverRegistry::observer_list &empty_observer_list() {
            static const ObserverRegistry::observer_list empty{};
            return empty;
        }

        template<typename D>
        std::vector<std::vector<D> > make_groups(const std::vector<D> &dependencies, bool split) {
            if (!split || dependencies.empty()) { return {dependencies}; }
            std::vector<std::vector<D> > groups;
            groups.reserve(dependencies.size());
            for (const auto &dependency: dependencies) { groups.push_back({dependency}); }
            return groups;
        }
    } // namespace

    ObserverRegistry::ObserverRegistry(DuplicatePolicy duplicate_policy) : _duplicate_policy{duplicate_policy} {
    }

    void ObserverRegistry::add(const observer_ptr &observer) {
        if (!observer) { throw_error<std::invalid_argument>("Cannot register a null observer"); }
        if (_duplicate_policy == DuplicatePolicy::REJECT && contains(observer->observer_id())) {
            throw_error<DuplicateObserver>("Observer {} is already registered", observer->observer_id());
        }
        _by_id.try_emplace(observer->observer_id(), observer);
        for (const auto &trigger: observer->triggers()) {
            _by_trigger[trigger.component_id()][trigger.component_property()].push_back(observer);
        }
        ++_size;
    }

    const ObserverRegistry::observer_list &ObserverRegistry::observers(std::string_view component_id,
                                                                       std::string_view component_property) const {
        auto component = _by_trigger.find(component_id);
        if (component == _by_trigger.end()) { return empty_observer_list(); }
        auto property = component->second.find(component_property);
        if (property == component->second.end()) { return empty_observer_list(); }
        return property->second;
    }

    bool ObserverRegistry::observes(std::string_view component_id) const {
        return _by_trigger.contains(component_id);
    }

    bool ObserverRegistry::observes(std::string_view component_id, std::string_view component_property) const {
        return !observers(component_id, component_property).empty();
    }

    bool ObserverRegistry::contains(std::string_view observer_id) const { return _by_id.contains(observer_id); }

    observer_ptr ObserverRegistry::find(std::string_view observer_id) const {
        auto it = _by_id.find(observer_id);
        return it == _by_id.end() ? nullptr : it->second;
    }

    void ObserverRegistry::tag(std::type_index type, const observer_ptr &observer) {
        _by_type[type].push_back(observer);
    }

    const ObserverRegistry::observer_list &ObserverRegistry::tagged(std::type_index type) const {
        auto it = _by_type.find(type);
        return it == _by_type.end() ? empty_observer_list() : it->second;
    }

    ObserverRegistration::ObserverRegistration(ObserverRegistry &registry, std::vector<AnyDependency> dependencies,
                                               RegisterOptions options)
        : _registry{registry}, _dependencies{flatten_dependencies(dependencies)}, _options{options} {
    }

    void ObserverRegistration::register_function(CallbackFunction fn) {
        generate([this, &fn](std::vector<Published> publications, std::vector<Modified> modifications) {
            return std::make_shared<Observer>(std::move(publications), std::move(modifications),
                                              _dependencies.selections, _dependencies.updates, fn, _options.external);
        }, std::nullopt);
    }

    void ObserverRegistration::register_method(MethodFunction fn, std::type_index type) {
        generate([this, &fn, type](std::vector<Published> publications, std::vector<Modified> modifications) {
            return std::make_shared<Observer>(std::move(publications), std::move(modifications),
                                              _dependencies.selections, _dependencies.updates, fn, type,
                                              _options.external);
        }, type);
    }

    void ObserverRegistration::generate(const observer_factory &make_observer, std::optional<std::type_index> type) {
        // Errors are announced as publications of the callback exception id
        std::vector<Published> publications{_dependencies.publications};
        publications.insert(publications.end(), _dependencies.raised.begin(), _dependencies.raised.end());

        auto publication_groups = make_groups(publications, _options.split_publications);
        auto modification_groups = make_groups(_dependencies.modifications, _options.split_modifications);

        std::vector<observer_ptr> observers;
        observers.reserve(publication_groups.size() * modification_groups.size());
        for (const auto &publication_group: publication_groups) {
            for (const auto &modification_group: modification_groups) {
                observers.push_back(make_observer(publication_group, modification_group));
            }
        }

        // Check every observer before registering any, a rejected declaration leaves the registry untouched
        if (_registry.duplicate_policy() == DuplicatePolicy::REJECT) {
            for (const auto &observer: observers) {
                if (_registry.contains(observer->observer_id())) {
                    throw_error<DuplicateObserver>("Observer {} is already registered", observer->observer_id());
                }
            }
        }

        for (const auto &observer: observers) {
            _registry.add(observer);
            if (type) { _registry.tag(*type, observer); }
        }
        _observers = std::move(observers);
    }

    ObserverRegistration register_observer(ObserverRegistry &registry, std::vector<AnyDependency> dependencies,
                                           RegisterOptions options) {
        validate_dependencies(dependencies);
        return {registry, std::move(dependencies), options};
    }
} // namespace relay
