#include <relay/observers/observer_manager.h>
#include <relay/util/scope.h>
#include <relay/util/stack_trace.h>

#include <utility>

namespace relay {
    ObserverManager::ObserverManager(ObserverRegistry &shared_registry, Logger::ptr logger,
                                     ObserverManagerConfig config)
        : _shared_registry{shared_registry}, _registry{shared_registry.duplicate_policy()},
          _logger{logger ? std::move(logger) : null_logger()}, _config{config} {
    }

    std::vector<ValueUpdateHandler> ObserverManager::generate_handlers(const std::string &component_id,
                                                                       const std::string &component_property) {
        const auto &shared = _shared_registry.observers(component_id, component_property);
        const auto &local = _registry.observers(component_id, component_property);
        std::vector<ValueUpdateHandler> handlers;
        handlers.reserve(shared.size() + local.size());
        for (const auto *observers: {&shared, &local}) {
            for (const auto &observer: *observers) {
                handlers.emplace_back([this, observer, component_id, component_property](
                const Value &old_value, const Value &new_value) {
                        return dispatch(observer, component_id, component_property, old_value, new_value);
                    });
            }
        }
        return handlers;
    }

    ValueUpdateHandler ObserverManager::combine_handlers(std::vector<ValueUpdateHandler> handlers) {
        return [handlers = std::move(handlers)](const Value &old_value, const Value &new_value) -> Async<void> {
            std::vector<Async<void> > pending;
            pending.reserve(handlers.size());
            for (const auto &handler: handlers) { pending.push_back(handler(old_value, new_value)); }
            return when_all(std::move(pending));
        };
    }

    Async<void> ObserverManager::publish(const std::string &sender_id, const event_ptr &event) {
        if (!event) { throw_error<std::invalid_argument>("Cannot publish a null event from '{}'", sender_id); }
        const Event &published = *event;
        auto handlers = generate_handlers(sender_id, type_name(typeid(published)));
        if (handlers.empty()) {
            _logger->debug("No observer for {} published by '{}'", type_name(typeid(published)), sender_id);
            return {};
        }
        const Value payload{event};
        std::vector<Async<void> > pending;
        pending.reserve(handlers.size());
        for (const auto &handler: handlers) { pending.push_back(handler(Value{}, payload)); }
        return when_all(std::move(pending));
    }

    bool ObserverManager::observes(std::string_view component_id) const {
        return _shared_registry.observes(component_id) || _registry.observes(component_id);
    }

    bool ObserverManager::observes(std::string_view component_id, std::string_view component_property) const {
        return _shared_registry.observes(component_id, component_property) ||
               _registry.observes(component_id, component_property);
    }

    void ObserverManager::set_logger(Logger::ptr logger) { _logger = logger ? std::move(logger) : null_logger(); }

    Async<void> ObserverManager::apply_update(const std::string &, Component &component, std::string_view,
                                              std::string_view component_property, const Value &value) {
        component.set_property(component_property, value);
        return {};
    }

    Value ObserverManager::get_callback_arg(const std::string &, std::string_view component_id,
                                            std::string_view component_property) {
        auto component = get_component(component_id);
        if (component == nullptr) { throw PreventUpdate{}; }
        return component->property(component_property);
    }

    void ObserverManager::on_callback_error(const std::string &observer_id, const std::exception_ptr &error) {
        if (!error) { return; }
        if (!is_recoverable(error)) { std::rethrow_exception(error); }
        auto description = describe_error(error);
        _logger->error("Failed callback for {}: {} {}\n{}", observer_id, description.type_name, description.message,
                       get_stack_trace());
    }

    Async<std::optional<UpdateMap> > ObserverManager::send_callback(const std::string &observer_id,
                                                                     const Arguments &args) {
        // Identical registrations share an id, the one being dispatched must run its own callback
        auto observer = _forwarding && _forwarding->observer_id() == observer_id
                            ? _forwarding
                            : _shared_registry.find(observer_id);
        if (!observer) { observer = _registry.find(observer_id); }
        if (!observer) { throw_error<UnknownObserver>("No observer registered with id '{}'", observer_id); }
        _logger->warning("External execution is not configured, running {} locally", observer_id);
        return observer->callback(args);
    }

    Async<void> ObserverManager::dispatch(const observer_ptr &observer, const std::string &component_id,
                                          const std::string &component_property, const Value &old_value,
                                          const Value &new_value) {
        string_map<component_ptr> targets;
        Arguments args;
        try {
            for (const auto &update: observer->updates()) {
                auto component = get_component(update.component_id());
                // Targets that are not available yet are expected, this is not an error
                if (component == nullptr) { return {}; }
                targets.try_emplace(update.component_id(), component);
            }
            args = resolve_arguments(*observer, component_id, component_property, old_value, new_value);
        } catch (const PreventUpdate &) {
            return {};
        } catch (...) {
            on_callback_error(observer->observer_id(), std::current_exception());
            return {};
        }

        _logger->debug("Dispatching {} for {}.{}", observer->observer_id(), component_id, component_property);

        Async<std::optional<UpdateMap> > pending;
        if (observer->external()) {
            auto previous = std::exchange(_forwarding, observer);
            auto restore = make_scope_exit([this, &previous] { _forwarding = std::move(previous); });
            try {
                pending = send_callback(observer->observer_id(), args);
            } catch (...) {
                pending = Async<std::optional<UpdateMap> >::failed(std::current_exception());
            }
        } else {
            pending = observer->callback(args);
        }

        Promise<void> promise;
        auto done = promise.future();
        pending.on_complete([this, observer, targets = std::move(targets), promise](
        const Async<std::optional<UpdateMap> > &completed) mutable {
                Async<void> outcome;
                if (completed.has_error()) {
                    outcome = handle_callback_error(*observer, completed.error());
                } else if (const auto &updates = completed.get(); updates) {
                    outcome = apply_updates(*observer, targets, *updates);
                }
                outcome.on_complete([promise](const Async<void> &finished) mutable { promise.set_from(finished); });
            });
        return done;
    }

    Arguments ObserverManager::resolve_arguments(const Observer &observer, const std::string &component_id,
                                                 const std::string &component_property, const Value &old_value,
                                                 const Value &new_value) {
        Arguments args;
        args.reserve(observer.publications().size() + observer.modifications().size() +
                     observer.selections().size());

        // Events carry no state, only the publication that fired receives the payload
        for (const auto &publication: observer.publications()) {
            args.push_back(publication.component_id() == component_id ? new_value : Value{});
        }

        auto resolve = [&](const Dependency &dependency, bool is_select) -> Value {
            if (dependency.matches(component_id, component_property)) {
                // A select on the firing property sees the value from before the change
                return is_select ? old_value : new_value;
            }
            return get_callback_arg(observer.observer_id(), dependency.component_id(),
                                    dependency.component_property());
        };
        for (const auto &modification: observer.modifications()) { args.push_back(resolve(modification, false)); }
        for (const auto &selection: observer.selections()) { args.push_back(resolve(selection, true)); }
        return args;
    }

    Async<void> ObserverManager::handle_callback_error(const Observer &observer, const std::exception_ptr &error) {
        if (is_prevent_update(error)) { return {}; }
        on_callback_error(observer.observer_id(), error);
        // An error handler that fails is only reported, otherwise it could trigger itself
        if (observer.handles_errors() || !_config.dispatch_raised) { return {}; }
        return dispatch_raised(observer.observer_id(), error);
    }

    Async<void> ObserverManager::dispatch_raised(const std::string &observer_id, const std::exception_ptr &error) {
        auto description = describe_error(error);
        auto handlers = generate_handlers(std::string{CALLBACK_EXCEPTION_ID}, description.type_name);
        if (handlers.empty()) { return {}; }
        const Value payload{std::make_shared<const CallbackError>(observer_id, error)};
        std::vector<Async<void> > pending;
        pending.reserve(handlers.size());
        for (const auto &handler: handlers) { pending.push_back(handler(Value{}, payload)); }
        return when_all(std::move(pending));
    }

    Async<void> ObserverManager::apply_updates(const Observer &observer, const string_map<component_ptr> &targets,
                                               const UpdateMap &updates) {
        auto pending = std::make_shared<PendingUpdates>();
        pending->observer_id = observer.observer_id();
        for (const auto &[update_id, properties]: updates) {
            auto target = targets.find(update_id);
            component_ptr component = target == targets.end() ? nullptr : target->second;
            for (const auto &[property, value]: properties) {
                pending->updates.push_back(PendingUpdate{component, update_id, property, value});
            }
        }
        auto done = pending->promise.future();
        apply_next(pending);
        return done;
    }

    void ObserverManager::apply_next(const std::shared_ptr<PendingUpdates> &pending) {
        while (pending->next < pending->updates.size()) {
            const auto &update = pending->updates[pending->next++];
            Async<void> applied;
            try {
                // Results from send_callback may name targets that were not resolved before the call
                auto component = update.component != nullptr ? update.component : get_component(update.component_id);
                if (component == nullptr) {
                    throw_error<ObserverError>("Observer {} produced an update for '{}' which is not available",
                                               pending->observer_id, update.component_id);
                }
                applied = apply_update(pending->observer_id, *component, update.component_id,
                                       update.component_property, update.value);
            } catch (...) {
                applied = Async<void>::failed(std::current_exception());
            }

            if (!applied.is_ready()) {
                applied.on_complete([this, pending](const Async<void> &completed) {
                    if (completed.has_error() && !continue_after_apply_error(*pending, completed.error())) {
                        pending->promise.set_value();
                        return;
                    }
                    apply_next(pending);
                });
                return;
            }
            if (applied.has_error() && !continue_after_apply_error(*pending, applied.error())) { break; }
        }
        pending->promise.set_value();
    }

    bool ObserverManager::continue_after_apply_error(const PendingUpdates &pending, const std::exception_ptr &error) {
        if (!is_prevent_update(error)) { on_callback_error(pending.observer_id, error); }
        return _config.apply_failure_policy == ApplyFailurePolicy::CONTINUE_REMAINING;
    }
} // namespace relay
