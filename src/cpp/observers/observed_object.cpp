#include <relay/observers/observed_object.h>
#include <relay/observers/observer_manager.h>

namespace relay {
    ObservedValue::ObservedValue(Value value, ValueUpdateHandler on_change)
        : _value{std::move(value)}, _on_change{std::move(on_change)} {
    }

    void ObservedValue::set_on_change(ValueUpdateHandler on_change) { _on_change = std::move(on_change); }

    Async<void> ObservedValue::set(Value value) {
        if (value == _value) { return {}; }
        auto old_value = std::exchange(_value, std::move(value));
        if (!_on_change) { return {}; }
        // Handlers may change the field (or its handler) again, they are given their own copies
        const Value new_value{_value};
        auto on_change = _on_change;
        return on_change(old_value, new_value);
    }

    ObservedObject::ObservedObject(const FieldDeclarations &declarations) {
        _names.reserve(declarations.size());
        for (const auto &[name, holder]: declarations) {
            if (!_values.try_emplace(name, holder).second) {
                throw_error<std::invalid_argument>("Field '{}' is declared more than once", name);
            }
            _names.push_back(name);
        }
        // Holders are not added after this point, their addresses are stable
        for (auto &[name, holder]: _values) {
            auto *value = &holder;
            _fields.try_emplace(name, Field{
                                    [value] { return value->value(); },
                                    [value](Value new_value) {
                                        // The outcome of the change handler is not awaited
                                        static_cast<void>(value->set(std::move(new_value)));
                                    }
                                });
        }
    }

    const ObservedObject::Field &ObservedObject::field(std::string_view name) const {
        auto it = _fields.find(name);
        if (it == _fields.end()) { throw_error<UnknownProperty>("No observed field named '{}'", name); }
        return it->second;
    }

    Value ObservedObject::get(std::string_view name) const { return field(name).get(); }

    void ObservedObject::set(std::string_view name, Value value) { field(name).set(std::move(value)); }

    bool ObservedObject::observe(std::string_view name, ValueUpdateHandler handler) {
        auto it = _values.find(name);
        if (it == _values.end()) { return false; }
        it->second.set_on_change(std::move(handler));
        return true;
    }

    bool ObservedObject::has_field(std::string_view name) const { return _fields.contains(name); }

    ObservedComponent::ObservedComponent(std::string id, const FieldDeclarations &declarations)
        : ObservedObject(declarations), _id{std::move(id)} {
        if (_id.empty()) { throw_error<MissingComponentId>("An observed component requires an id"); }
    }

    Value ObservedComponent::property(std::string_view name) const { return get(name); }

    void ObservedComponent::set_property(std::string_view name, Value value) { set(name, std::move(value)); }

    std::size_t connect(ObserverManager &manager, ObservedComponent &component) {
        std::size_t connected{0};
        for (const auto &name: component.field_names()) {
            if (!manager.observes(component.id(), name)) { continue; }
            component.observe(name, ObserverManager::combine_handlers(manager.generate_handlers(component.id(), name)));
            ++connected;
        }
        return connected;
    }
} // namespace relay
