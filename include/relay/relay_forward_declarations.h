#ifndef RELAY_FORWARD_DECLARATIONS_H
#define RELAY_FORWARD_DECLARATIONS_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relay {
    // Value - held by value, payload objects are shared
    class Value;
    struct Object;
    struct Event;
    using object_ptr = std::shared_ptr<const Object>;
    using event_ptr = std::shared_ptr<const Event>;

    template<typename T>
    class Async;

    template<typename T>
    class Promise;

    // Component - owned by the host, raw pointer only
    struct Component;
    using component_ptr = Component *;

    // Observer - shared between the indexes of a registry and the handlers generated from it
    class Observer;
    using observer_ptr = std::shared_ptr<Observer>;

    class ObserverRegistry;
    class ObserverRegistration;
    class ObserverManager;

    class ObservedValue;
    class ObservedObject;
    class ObservedComponent;

    class EventLoop;

    struct Logger;
    using logger_ptr = std::shared_ptr<Logger>;

    using Arguments = std::vector<Value>;

    /**
     * The shape of every change notification: called with the value before and after the mutation, completes when
     * all work triggered by the change is done.
     */
    using ValueUpdateHandler = std::function<Async<void>(const Value &old_value, const Value &new_value)>;
} // namespace relay

#endif // RELAY_FORWARD_DECLARATIONS_H
