#ifndef RELAY_OBSERVERS_OBSERVED_OBJECT_H
#define RELAY_OBSERVERS_OBSERVED_OBJECT_H

#include <relay/observers/exceptions.h>
#include <relay/types/async.h>
#include <relay/types/component.h>

#include <utility>

namespace relay {
    /**
     * Holder for an observed field: the current value and the handler notified when it changes.
     */
    class RELAY_EXPORT ObservedValue {
    public:
        explicit ObservedValue(Value value = {}, ValueUpdateHandler on_change = {});

        [[nodiscard]] const Value &value() const { return _value; }

        [[nodiscard]] const ValueUpdateHandler &on_change() const { return _on_change; }

        void set_on_change(ValueUpdateHandler on_change);

        /**
         * Store the value. When it differs from the current one and a handler is set, the handler is called with the
         * old and the new value and its (possibly pending) result is returned.
         */
        Async<void> set(Value value);

    private:
        Value _value;
        ValueUpdateHandler _on_change;
    };

    /**
     * Field names with their initial holder, declared once per type and copied into every instance.
     */
    using FieldDeclarations = std::vector<std::pair<std::string, ObservedValue> >;

    /**
     * An object made of observed fields, usable without a UI tree.
     *
     * Every instance holds its own copy of the declared holders, handlers set on one instance are never seen by
     * another. Each field is reached through an accessor/mutator pair created when the instance is constructed.
     * Setting a field calls the change handler before returning, so a handler that sets other fields runs their
     * handlers depth first inside the same call. Only a pending result is left to complete on its own, set() does
     * not wait for it. Hosts that want the handler to start on a later turn post the set to an EventLoop.
     */
    class RELAY_EXPORT ObservedObject {
    public:
        struct Field {
            std::function<Value()> get;
            std::function<void(Value)> set;
        };

        explicit ObservedObject(const FieldDeclarations &declarations);

        ObservedObject(const ObservedObject &) = delete;

        ObservedObject &operator=(const ObservedObject &) = delete;

        virtual ~ObservedObject() = default;

        /**
         * The accessor/mutator of the field, throws UnknownProperty when there is no such field.
         */
        [[nodiscard]] const Field &field(std::string_view name) const;

        [[nodiscard]] Value get(std::string_view name) const;

        void set(std::string_view name, Value value);

        /**
         * Replace the change handler of the field, returns false (and does nothing) when there is no such field.
         */
        bool observe(std::string_view name, ValueUpdateHandler handler);

        [[nodiscard]] bool has_field(std::string_view name) const;

        /**
         * Field names in declaration order.
         */
        [[nodiscard]] const std::vector<std::string> &field_names() const { return _names; }

    private:
        string_map<ObservedValue> _values;
        string_map<Field> _fields;
        std::vector<std::string> _names;
    };

    /**
     * An observed object identified by an id, so it can take part in observer dependencies.
     */
    class RELAY_EXPORT ObservedComponent : public ObservedObject, public Component {
    public:
        ObservedComponent(std::string id, const FieldDeclarations &declarations);

        [[nodiscard]] const std::string &id() const override { return _id; }

        [[nodiscard]] Value property(std::string_view name) const override;

        void set_property(std::string_view name, Value value) override;

    private:
        std::string _id;
    };

    /**
     * Route changes of the observed fields of the component to the observers of the manager. Fields that nothing
     * observes are left alone. Returns the number of fields connected.
     */
    RELAY_EXPORT std::size_t connect(ObserverManager &manager, ObservedComponent &component);
} // namespace relay

#endif // RELAY_OBSERVERS_OBSERVED_OBJECT_H
