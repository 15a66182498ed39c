#include <relay/types/value.h>

namespace relay {
    std::string Object::to_string() const {
        return fmt::format("{}@{:p}", relay::type_name(typeid(*this)), static_cast<const void *>(this));
    }

    namespace {
        struct TypeNameVisitor {
            std::string operator()(const std::monostate &) const { return "null"; }
            std::string operator()(const NoUpdate &) const { return "no_update"; }
            std::string operator()(const bool &) const { return "bool"; }
            std::string operator()(const int64_t &) const { return "int"; }
            std::string operator()(const double &) const { return "float"; }
            std::string operator()(const std::string &) const { return "str"; }
            std::string operator()(const Value::List &) const { return "list"; }

            std::string operator()(const object_ptr &value) const {
                return value ? relay::type_name(typeid(*value)) : "null";
            }
        };

        struct ToStringVisitor {
            std::string operator()(const std::monostate &) const { return "null"; }
            std::string operator()(const NoUpdate &) const { return "no_update"; }
            std::string operator()(const bool &value) const { return relay::to_string(value); }
            std::string operator()(const int64_t &value) const { return relay::to_string(value); }
            std::string operator()(const double &value) const { return relay::to_string(value); }
            std::string operator()(const std::string &value) const { return value; }

            std::string operator()(const Value::List &value) const {
                std::vector<std::string> items;
                items.reserve(value.size());
                for (const auto &item: value) { items.push_back(item.to_string()); }
                return fmt::format("[{}]", fmt::join(items, ", "));
            }

            std::string operator()(const object_ptr &value) const { return value ? value->to_string() : "null"; }
        };
    } // namespace

    std::string Value::type_name() const { return std::visit(TypeNameVisitor{}, _storage); }

    std::string Value::to_string() const { return std::visit(ToStringVisitor{}, _storage); }

    bool operator==(const Value &lhs, const Value &rhs) { return lhs._storage == rhs._storage; }
} // namespace relay
