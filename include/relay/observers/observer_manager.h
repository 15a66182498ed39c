#ifndef RELAY_OBSERVERS_OBSERVER_MANAGER_H
#define RELAY_OBSERVERS_OBSERVER_MANAGER_H

#include <relay/observers/observer_registry.h>
#include <relay/util/logging.h>

namespace relay {
    /**
     * What happens to the remaining updates of a dispatch once applying one of them fails.
     */
    enum class ApplyFailurePolicy {
        ABORT_REMAINING,    // Stop at the first failure, remaining updates are not applied
        CONTINUE_REMAINING  // Report the failure and carry on with the remaining updates
    };

    struct ObserverManagerConfig {
        ApplyFailurePolicy apply_failure_policy{ApplyFailurePolicy::ABORT_REMAINING};
        // Dispatch observers declared with Raised when a callback fails
        bool dispatch_raised{true};
    };

    /**
     * Generates the handlers a host calls when a component property changes (or a component publishes an event),
     * and performs the dispatch for each triggered observer:
     *
     * 1. every update target is resolved with get_component, a missing target silently skips the dispatch,
     * 2. the arguments are resolved (publications, modifications, then selections),
     * 3. the callback runs, locally or through send_callback for external observers,
     * 4. the updates produced are applied with apply_update.
     *
     * Failures are contained to the observer that raised them: they are reported through on_callback_error and the
     * dispatch produces no update. PreventUpdate skips the dispatch silently. Fatal errors are re-thrown.
     *
     * Observers come from two registries: the shared registry handed to the manager (observers declared for the
     * whole application) and the manager's own registry (observers declared with ``when`` on this instance).
     * Handlers from the shared registry are generated first.
     *
     * The manager must outlive any dispatch it started.
     */
    class RELAY_EXPORT ObserverManager {
    public:
        explicit ObserverManager(ObserverRegistry &shared_registry, Logger::ptr logger = null_logger(),
                                 ObserverManagerConfig config = {});

        ObserverManager(const ObserverManager &) = delete;

        ObserverManager &operator=(const ObserverManager &) = delete;

        virtual ~ObserverManager() = default;

        template<typename... Deps>
            requires (sizeof...(Deps) > 0 && (std::constructible_from<AnyDependency, Deps> && ...))
        [[nodiscard]] ObserverRegistration when(RegisterOptions options, Deps &&... dependencies) {
            return relay::when(_registry, options, std::forward<Deps>(dependencies)...);
        }

        /**
         * Register into the registry of this manager only.
         */
        template<typename... Deps>
            requires (sizeof...(Deps) > 0 && (std::constructible_from<AnyDependency, Deps> && ...))
        [[nodiscard]] ObserverRegistration when(Deps &&... dependencies) {
            return relay::when(_registry, RegisterOptions{}, std::forward<Deps>(dependencies)...);
        }

        /**
         * One handler per observer triggered by the component property, shared registry first.
         */
        [[nodiscard]] std::vector<ValueUpdateHandler> generate_handlers(const std::string &component_id,
                                                                        const std::string &component_property);

        /**
         * A single handler running all the handlers given, completes when all of them have.
         */
        [[nodiscard]] static ValueUpdateHandler combine_handlers(std::vector<ValueUpdateHandler> handlers);

        /**
         * Announce an event sent by a component. Observers with a Published dependency on the sender and the
         * dynamic type of the event are dispatched.
         */
        Async<void> publish(const std::string &sender_id, const event_ptr &event);

        /**
         * Bind the method observers declared on T (in either registry) to the instance.
         */
        template<typename T>
        void attach_to_instance(const std::shared_ptr<T> &instance) {
            std::shared_ptr<void> bound{instance};
            for (const auto &observer: _shared_registry.tagged(typeid(T))) { observer->bind(bound); }
            for (const auto &observer: _registry.tagged(typeid(T))) { observer->bind(bound); }
        }

        [[nodiscard]] bool observes(std::string_view component_id) const;

        [[nodiscard]] bool observes(std::string_view component_id, std::string_view component_property) const;

        [[nodiscard]] ObserverRegistry &registry() { return _registry; }

        [[nodiscard]] ObserverRegistry &shared_registry() { return _shared_registry; }

        [[nodiscard]] const ObserverManagerConfig &config() const { return _config; }

        [[nodiscard]] const Logger::ptr &logger() const { return _logger; }

        void set_logger(Logger::ptr logger);

        /**
         * Look up a component by id, nullptr when it is not currently available.
         */
        [[nodiscard]] virtual component_ptr get_component(std::string_view component_id) = 0;

        /**
         * Write an update produced by an observer, by default sets the property of the component.
         */
        virtual Async<void> apply_update(const std::string &observer_id, Component &component,
                                         std::string_view component_id, std::string_view component_property,
                                         const Value &value);

        /**
         * Read a non triggering argument, by default the property of the component.
         * Throws PreventUpdate when the component is not available.
         */
        [[nodiscard]] virtual Value get_callback_arg(const std::string &observer_id, std::string_view component_id,
                                                     std::string_view component_property);

        /**
         * Report a failed dispatch. Fatal errors are re-thrown, others are logged with a stack trace.
         */
        virtual void on_callback_error(const std::string &observer_id, const std::exception_ptr &error);

        /**
         * Run an external observer. By default runs the observer being dispatched, or looks the id up in the shared
         * registry and then the local one. Throws UnknownObserver when no observer has the id.
         */
        [[nodiscard]] virtual Async<std::optional<UpdateMap> > send_callback(const std::string &observer_id,
                                                                              const Arguments &args);

    protected:
        /**
         * Run one observer for a change of component_id.component_property, completes once its updates have been
         * applied.
         */
        Async<void> dispatch(const observer_ptr &observer, const std::string &component_id,
                             const std::string &component_property, const Value &old_value, const Value &new_value);

    private:
        struct PendingUpdate {
            component_ptr component;
            std::string component_id;
            std::string component_property;
            Value value;
        };

        struct PendingUpdates {
            std::string observer_id;
            std::vector<PendingUpdate> updates;
            std::size_t next{0};
            Promise<void> promise;
        };

        [[nodiscard]] Arguments resolve_arguments(const Observer &observer, const std::string &component_id,
                                                  const std::string &component_property, const Value &old_value,
                                                  const Value &new_value);

        Async<void> handle_callback_error(const Observer &observer, const std::exception_ptr &error);

        Async<void> dispatch_raised(const std::string &observer_id, const std::exception_ptr &error);

        Async<void> apply_updates(const Observer &observer, const string_map<component_ptr> &targets,
                                  const UpdateMap &updates);

        void apply_next(const std::shared_ptr<PendingUpdates> &pending);

        [[nodiscard]] bool continue_after_apply_error(const PendingUpdates &pending, const std::exception_ptr &error);

        ObserverRegistry &_shared_registry;
        ObserverRegistry _registry;
        Logger::ptr _logger;
        ObserverManagerConfig _config;
        // The external observer whose dispatch is currently in send_callback
        observer_ptr _forwarding;
    };
} // namespace relay

#endif // RELAY_OBSERVERS_OBSERVER_MANAGER_H
