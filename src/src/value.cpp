#include <bon/value.h>
#include <bon/serializer.h>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace bon {

Value::Value() : v(object_t{}) {}
Value::Value(list_t items) : v(std::move(items)) {}
Value::Value(object_t nodes) : v(std::move(nodes)) {}

Value Value::list(list_t items) { return Value(std::move(items)); }
Value Value::object(object_t nodes) { return Value(std::move(nodes)); }

size_t Value::size() const noexcept {
    if (is_list()) return as_list().size();
    if (is_object()) return as_object().size();
    return 0;
}

const Value& Value::at(size_t idx) const {
    if (is_list()) {
        const auto& L = as_list();
        if (idx >= L.size()) throw std::out_of_range("index out of range");
        return L[idx];
    }
    if (is_object()) {
        const auto& O = as_object();
        if (idx >= O.size()) throw std::out_of_range("index out of range");
        return O[idx].value;
    }
    throw std::out_of_range(std::string("cannot index a ") + type_name(type()));
}

size_t Value::count(const std::string& key) const noexcept {
    if (not is_object()) return 0;
    size_t n = 0;
    for (auto const& node : as_object())
        if (node.key == key) ++n;
    return n;
}

const Value& Value::at(const std::string& key) const {
    if (not is_object()) throw std::out_of_range("not an object");
    const Value* found = nullptr;
    for (auto const& node : as_object()) {
        if (node.key != key) continue;
        if (found) throw std::runtime_error("duplicate key '" + key + "'");
        found = &node.value;
    }
    if (not found) throw std::out_of_range("key not found: '" + key + "'");
    return *found;
}

std::vector<const Value*> Value::find_all(const std::string& key) const {
    std::vector<const Value*> out;
    if (not is_object()) return out;
    for (auto const& node : as_object())
        if (node.key == key) out.push_back(&node.value);
    return out;
}

std::vector<std::string> Value::keys() const {
    if (not is_object()) throw std::runtime_error("not an object");
    std::vector<std::string> out;
    out.reserve(as_object().size());
    for (auto const& node : as_object()) out.push_back(node.key);
    return out;
}

std::string Value::dump() const {
    SerializeOptions options;
    options.pretty = false;
    return serialize(*this, options);
}

std::string Value::dump(int indent) const {
    SerializeOptions options;
    options.pretty = true;
    options.indent_width = indent;
    return serialize(*this, options);
}

bool Value::operator==(const Value& rhs) const { return deep_equals(*this, rhs); }

bool operator==(const Node& lhs, const Node& rhs) {
    return lhs.key == rhs.key and deep_equals(lhs.value, rhs.value);
}

bool deep_equals(const Value& a, const Value& b) {
    if (a.type() != b.type()) return false;
    switch (a.type()) {
        case Value::String:
            return a.as_string() == b.as_string();
        case Value::Integer:
            return a.as_int() == b.as_int();
        case Value::Float: {
            double x = a.as_float(), y = b.as_float();
            if (std::isnan(x) and std::isnan(y)) return true;
            return x == y and std::signbit(x) == std::signbit(y);
        }
        case Value::List: {
            const auto& L = a.as_list();
            const auto& R = b.as_list();
            if (L.size() != R.size()) return false;
            for (size_t i = 0; i < L.size(); ++i)
                if (not deep_equals(L[i], R[i])) return false;
            return true;
        }
        case Value::Object: {
            const auto& L = a.as_object();
            const auto& R = b.as_object();
            if (L.size() != R.size()) return false;
            for (size_t i = 0; i < L.size(); ++i)
                if (L[i] != R[i]) return false;
            return true;
        }
    }
    return false;
}

const char* type_name(Value::TYPE type) noexcept {
    switch (type) {
        case Value::String:
            return "string";
        case Value::Integer:
            return "integer";
        case Value::Float:
            return "float";
        case Value::List:
            return "list";
        case Value::Object:
            return "object";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    os << value.dump();
    return os;
}

}  // namespace bon
