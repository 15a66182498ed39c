#include <relay/observers/observer.h>

#include <algorithm>

namespace relay {
    std::string make_observer_id(const std::vector<Published> &publications,
                                 const std::vector<Modified> &modifications, const std::vector<Update> &updates) {
        std::vector<std::string> triggers;
        triggers.reserve(publications.size() + modifications.size());
        for (const auto &dep: publications) { triggers.push_back(dep.key()); }
        for (const auto &dep: modifications) { triggers.push_back(dep.key()); }
        std::vector<std::string> outputs;
        outputs.reserve(updates.size());
        for (const auto &dep: updates) { outputs.push_back(dep.key()); }
        return fmt::format("{}...{}", fmt::join(triggers, ".."), fmt::join(outputs, ".."));
    }

    Observer::Observer(std::vector<Published> publications, std::vector<Modified> modifications,
                       std::vector<Select> selections, std::vector<Update> updates, CallbackFunction callback,
                       bool external)
        : _observer_id{make_observer_id(publications, modifications, updates)},
          _publications{std::move(publications)}, _modifications{std::move(modifications)},
          _selections{std::move(selections)}, _updates{std::move(updates)}, _callback{std::move(callback)},
          _external{external} {
        if (!_callback) { throw_error<std::invalid_argument>("Observer {} requires a callback", _observer_id); }
    }

    Observer::Observer(std::vector<Published> publications, std::vector<Modified> modifications,
                       std::vector<Select> selections, std::vector<Update> updates, MethodFunction method,
                       std::type_index instance_type, bool external)
        : _observer_id{make_observer_id(publications, modifications, updates)},
          _publications{std::move(publications)}, _modifications{std::move(modifications)},
          _selections{std::move(selections)}, _updates{std::move(updates)}, _method{std::move(method)},
          _instance_type{instance_type}, _external{external} {
        if (!_method) { throw_error<std::invalid_argument>("Observer {} requires a callback", _observer_id); }
    }

    bool Observer::handles_errors() const {
        return std::ranges::any_of(_publications, [](const Published &dep) {
            return dep.component_id() == CALLBACK_EXCEPTION_ID;
        });
    }

    std::vector<Dependency> Observer::triggers() const {
        std::vector<Dependency> triggers;
        triggers.reserve(_publications.size() + _modifications.size());
        triggers.insert(triggers.end(), _publications.begin(), _publications.end());
        triggers.insert(triggers.end(), _modifications.begin(), _modifications.end());
        return triggers;
    }

    bool Observer::is_bound() const { return !_instance.expired(); }

    void Observer::bind(const std::shared_ptr<void> &instance) {
        if (!is_method()) { throw_error<ObserverError>("Observer {} is not a method and cannot be bound", _observer_id); }
        if (!instance) { throw_error<ObserverError>("Observer {} cannot be bound to a null instance", _observer_id); }
        if (is_bound() && _instance.lock() != instance) {
            throw_error<ObserverError>("Observer {} is already bound to a live instance", _observer_id);
        }
        _instance = instance;
    }

    CallbackResult Observer::invoke(const Arguments &args) const {
        if (!is_method()) { return _callback(args); }
        auto instance = _instance.lock();
        if (instance) { return _method(instance, args); }
        if (_instance.owner_before(std::weak_ptr<void>{}) || std::weak_ptr<void>{}.owner_before(_instance)) {
            throw_error<InstanceExpired>("Instance bound to observer {} no longer exists", _observer_id);
        }
        throw_error<ObserverError>("Observer {} has not been bound to an instance", _observer_id);
    }

    Async<std::optional<UpdateMap> > Observer::callback(const Arguments &args) const {
        CallbackResult pending;
        try {
            pending = invoke(args);
        } catch (...) {
            // Synchronous failures are reported the same way as asynchronous ones.
            return Async<std::optional<UpdateMap> >::failed(std::current_exception());
        }
        return pending.then([this](const CallbackResult &completed) -> std::optional<UpdateMap> {
            return normalize_result(completed.get());
        });
    }

    std::optional<UpdateMap> Observer::normalize_result(const Value &result) const {
        if (result.is_no_update() || _updates.empty()) { return std::nullopt; }

        const Value::List single{result};
        const auto &results = _updates.size() == 1 || !result.is_list() ? single : result.as<Value::List>();

        UpdateMap updates;
        const auto count = std::min(results.size(), _updates.size());
        for (std::size_t i = 0; i < count; ++i) {
            if (results[i].is_no_update()) { continue; }
            const auto &update = _updates[i];
            updates[update.component_id()][update.component_property()] = results[i];
        }
        if (updates.empty()) { return std::nullopt; }
        return updates;
    }

    std::string Observer::to_string() const {
        std::vector<std::string> publications;
        for (const auto &dep: _publications) { publications.push_back(describe(dep)); }
        std::vector<std::string> modifications;
        for (const auto &dep: _modifications) { modifications.push_back(describe(dep)); }
        std::vector<std::string> selections;
        for (const auto &dep: _selections) { selections.push_back(describe(dep)); }
        std::vector<std::string> updates;
        for (const auto &dep: _updates) { updates.push_back(describe(dep)); }
        return fmt::format("Observer('{}', [{}], [{}], [{}], [{}], external={})", _observer_id,
                           fmt::join(publications, ", "), fmt::join(modifications, ", "),
                           fmt::join(selections, ", "), fmt::join(updates, ", "), _external);
    }
} // namespace relay
