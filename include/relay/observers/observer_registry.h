#ifndef RELAY_OBSERVERS_OBSERVER_REGISTRY_H
#define RELAY_OBSERVERS_OBSERVER_REGISTRY_H

#include <relay/observers/observer.h>

#include <concepts>
#include <functional>
#include <type_traits>

namespace relay {
    /**
     * What to do when an observer is registered with the same identity (triggers and updates) as an existing one.
     */
    enum class DuplicatePolicy {
        COEXIST, // Both observers are kept and both run
        REJECT   // The registration fails with DuplicateObserver
    };

    struct RegisterOptions {
        // One observer per publication rather than one observer for all the publications
        bool split_publications{false};
        // One observer per modification rather than one observer for all the modifications
        bool split_modifications{false};
        // Run the callback through ObserverManager::send_callback
        bool external{false};
    };

    /**
     * The indexes of registered observers:
     * - by trigger (component id, then property), in registration order,
     * - by observer id, for external execution,
     * - by the type owning a method callback, for late binding to an instance.
     *
     * Registries are populated during initialisation and only read while dispatching.
     */
    class RELAY_EXPORT ObserverRegistry {
    public:
        using observer_list = std::vector<observer_ptr>;

        explicit ObserverRegistry(DuplicatePolicy duplicate_policy = DuplicatePolicy::COEXIST);

        ObserverRegistry(const ObserverRegistry &) = delete;

        ObserverRegistry &operator=(const ObserverRegistry &) = delete;

        [[nodiscard]] DuplicatePolicy duplicate_policy() const { return _duplicate_policy; }

        /**
         * Index the observer against each of its triggers.
         * Throws DuplicateObserver if the policy is REJECT and an observer with the same id is already registered.
         */
        void add(const observer_ptr &observer);

        [[nodiscard]] const observer_list &observers(std::string_view component_id,
                                                     std::string_view component_property) const;

        [[nodiscard]] bool observes(std::string_view component_id) const;

        [[nodiscard]] bool observes(std::string_view component_id, std::string_view component_property) const;

        [[nodiscard]] bool contains(std::string_view observer_id) const;

        /**
         * The first observer registered with this id, nullptr when there is none.
         */
        [[nodiscard]] observer_ptr find(std::string_view observer_id) const;

        void tag(std::type_index type, const observer_ptr &observer);

        [[nodiscard]] const observer_list &tagged(std::type_index type) const;

        [[nodiscard]] std::size_t size() const { return _size; }

    private:
        DuplicatePolicy _duplicate_policy;
        string_map<string_map<observer_list> > _by_trigger;
        string_map<observer_ptr> _by_id;
        ankerl::unordered_dense::map<std::type_index, observer_list> _by_type;
        std::size_t _size{0};
    };

    namespace detail {
        /**
         * Invoke a user callback and present its result as a CallbackResult.
         * A void result (or Async<void>) produces no_update.
         */
        template<typename F, typename... Args>
        CallbackResult invoke_callback(F &fn, Args &&... args) {
            using R = std::invoke_result_t<F &, Args...>;
            if constexpr (std::is_void_v<R>) {
                std::invoke(fn, std::forward<Args>(args)...);
                return CallbackResult{Value{no_update}};
            } else if constexpr (is_async_v<R>) {
                using T = async_value_t<R>;
                if constexpr (std::is_same_v<T, Value>) {
                    return std::invoke(fn, std::forward<Args>(args)...);
                } else {
                    return std::invoke(fn, std::forward<Args>(args)...).then([](const Async<T> &completed) -> Value {
                        if constexpr (std::is_void_v<T>) {
                            completed.get();
                            return Value{no_update};
                        } else {
                            return Value{completed.get()};
                        }
                    });
                }
            } else {
                return CallbackResult{Value{std::invoke(fn, std::forward<Args>(args)...)}};
            }
        }
    } // namespace detail

    /**
     * The result of register_observer: applying it to a callable creates and registers the observers for the
     * dependencies it was given, and returns the callable unchanged.
     *
     * Member function pointers produce method observers, tagged with the class so that
     * ObserverManager::attach_to_instance can bind them once an instance exists.
     */
    class RELAY_EXPORT ObserverRegistration {
    public:
        ObserverRegistration(ObserverRegistry &registry, std::vector<AnyDependency> dependencies,
                             RegisterOptions options = {});

        template<typename F>
            requires (!std::is_member_function_pointer_v<std::decay_t<F> > &&
                      std::invocable<std::decay_t<F> &, const Arguments &>)
        std::decay_t<F> operator()(F &&fn) {
            std::decay_t<F> result{std::forward<F>(fn)};
            register_function([fn = result](const Arguments &args) mutable {
                return detail::invoke_callback(fn, args);
            });
            return result;
        }

        template<typename T, typename R>
        auto operator()(R (T::*method)(const Arguments &)) -> R (T::*)(const Arguments &) {
            register_method([method](const std::shared_ptr<void> &instance, const Arguments &args) {
                return detail::invoke_callback(method, *static_cast<T *>(instance.get()), args);
            }, typeid(T));
            return method;
        }

        template<typename T, typename R>
        auto operator()(R (T::*method)(const Arguments &) const) -> R (T::*)(const Arguments &) const {
            register_method([method](const std::shared_ptr<void> &instance, const Arguments &args) {
                return detail::invoke_callback(method, *static_cast<const T *>(instance.get()), args);
            }, typeid(T));
            return method;
        }

        /**
         * Observers created by the last application, one per combination of publication and modification groups.
         */
        [[nodiscard]] const std::vector<observer_ptr> &observers() const { return _observers; }

    private:
        using observer_factory = std::function<observer_ptr(std::vector<Published>, std::vector<Modified>)>;

        void register_function(CallbackFunction fn);

        void register_method(MethodFunction fn, std::type_index type);

        void generate(const observer_factory &make_observer, std::optional<std::type_index> type);

        ObserverRegistry &_registry;
        FlattenedDependencies _dependencies;
        RegisterOptions _options;
        std::vector<observer_ptr> _observers;
    };

    /**
     * Validate the dependencies and prepare the registration of a callback into the registry.
     * Throws std::invalid_argument when the dependencies cannot form an observer.
     */
    [[nodiscard]] RELAY_EXPORT ObserverRegistration register_observer(ObserverRegistry &registry,
                                                                      std::vector<AnyDependency> dependencies,
                                                                      RegisterOptions options = {});

    template<typename... Deps>
        requires (sizeof...(Deps) > 0 && (std::constructible_from<AnyDependency, Deps> && ...))
    [[nodiscard]] ObserverRegistration when(ObserverRegistry &registry, RegisterOptions options, Deps &&... dependencies) {
        return register_observer(registry, std::vector<AnyDependency>{AnyDependency{std::forward<Deps>(dependencies)}...},
                                 options);
    }

    /**
     * Register into the given (usually the application wide) registry:
     *
     * .. code-block:: c++
     *
     *     when(registry, Modified("ping", "value"), Update("pong", "value"))(
     *         [](const Arguments &args) { return args[0]; });
     */
    template<typename... Deps>
        requires (sizeof...(Deps) > 0 && (std::constructible_from<AnyDependency, Deps> && ...))
    [[nodiscard]] ObserverRegistration when(ObserverRegistry &registry, Deps &&... dependencies) {
        return when(registry, RegisterOptions{}, std::forward<Deps>(dependencies)...);
    }
} // namespace relay

#endif // RELAY_OBSERVERS_OBSERVER_REGISTRY_H
