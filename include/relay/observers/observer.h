#ifndef RELAY_OBSERVERS_OBSERVER_H
#define RELAY_OBSERVERS_OBSERVER_H

#include <relay/observers/dependencies.h>
#include <relay/types/async.h>

#include <optional>
#include <typeindex>

namespace relay {
    /**
     * Updates produced by a callback: values by component id, then by property, in declaration order.
     */
    using UpdateMap = string_map<string_map<Value> >;

    using CallbackResult = Async<Value>;

    /**
     * A free callback, receives the resolved arguments (publications, modifications, selections).
     */
    using CallbackFunction = std::function<CallbackResult(const Arguments &)>;

    /**
     * A method callback, receives the instance it was bound to.
     */
    using MethodFunction = std::function<CallbackResult(const std::shared_ptr<void> &, const Arguments &)>;

    /**
     * Specification details for one input/output observer: its dependencies and the callback that links them.
     *
     * The identity of an observer is derived from its triggers and its updates, e.g. ``a@value..b@value...c@value``.
     * Observers are created once at registration and are not modified afterwards, with the exception of binding a
     * method observer to the instance that owns the method.
     */
    class RELAY_EXPORT Observer {
    public:
        using ptr = observer_ptr;

        Observer(std::vector<Published> publications, std::vector<Modified> modifications,
                 std::vector<Select> selections, std::vector<Update> updates, CallbackFunction callback,
                 bool external = false);

        /**
         * An observer whose callback is a method, it must be bound to an instance before it can run.
         */
        Observer(std::vector<Published> publications, std::vector<Modified> modifications,
                 std::vector<Select> selections, std::vector<Update> updates, MethodFunction method,
                 std::type_index instance_type, bool external = false);

        [[nodiscard]] const std::string &observer_id() const { return _observer_id; }

        [[nodiscard]] const std::vector<Published> &publications() const { return _publications; }

        [[nodiscard]] const std::vector<Modified> &modifications() const { return _modifications; }

        [[nodiscard]] const std::vector<Select> &selections() const { return _selections; }

        [[nodiscard]] const std::vector<Update> &updates() const { return _updates; }

        [[nodiscard]] bool external() const { return _external; }

        /**
         * True when the observer is triggered by errors raised in other callbacks.
         */
        [[nodiscard]] bool handles_errors() const;

        /**
         * Every dependency that triggers this observer, publications first.
         */
        [[nodiscard]] std::vector<Dependency> triggers() const;

        [[nodiscard]] bool is_method() const { return _instance_type.has_value(); }

        [[nodiscard]] std::optional<std::type_index> instance_type() const { return _instance_type; }

        /**
         * True while the bound instance is alive.
         */
        [[nodiscard]] bool is_bound() const;

        /**
         * Bind the instance that owns the method. The observer does not keep the instance alive.
         * Throws if the observer is not a method observer, or is still bound to another live instance.
         */
        void bind(const std::shared_ptr<void> &instance);

        /**
         * Run the callback and convert its result to the updates to apply, nullopt when there is nothing to apply.
         * Errors (including those thrown synchronously by the callback) are reported through the returned Async.
         */
        [[nodiscard]] Async<std::optional<UpdateMap> > callback(const Arguments &args) const;

        /**
         * Convert a callback result to updates:
         * - no_update, or an observer without updates, produces nothing;
         * - with a single update the result is the value of that update;
         * - otherwise a list result is matched positionally with the updates (other values are a single result);
         * - no_update entries are skipped, if nothing is left nothing is produced.
         */
        [[nodiscard]] std::optional<UpdateMap> normalize_result(const Value &result) const;

        [[nodiscard]] std::string to_string() const;

    private:
        [[nodiscard]] CallbackResult invoke(const Arguments &args) const;

        std::string _observer_id;
        std::vector<Published> _publications;
        std::vector<Modified> _modifications;
        std::vector<Select> _selections;
        std::vector<Update> _updates;
        CallbackFunction _callback;
        MethodFunction _method;
        std::optional<std::type_index> _instance_type;
        std::weak_ptr<void> _instance;
        bool _external;
    };

    [[nodiscard]] RELAY_EXPORT std::string make_observer_id(const std::vector<Published> &publications,
                                                            const std::vector<Modified> &modifications,
                                                            const std::vector<Update> &updates);
} // namespace relay

#endif // RELAY_OBSERVERS_OBSERVER_H
