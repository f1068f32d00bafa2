// bon::Value - the in-memory tree produced by the parser and consumed by the
// serializer.
#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace bon {

struct Node;

struct Value {
    using list_t = std::vector<Value>;
    using object_t = std::vector<Node>;

    enum TYPE { String, Integer, Float, List, Object };

    std::variant<std::string, int64_t, double, list_t, object_t> v;

    // A default-constructed Value is an empty Object, the usual document root.
    Value();
    Value(const std::string& s) : v(s) {}
    Value(std::string&& s) : v(std::move(s)) {}
    Value(const char* s) : v(std::string(s)) {}
    // Every integral type except bool becomes an Integer; unsigned values
    // above INT64_MAX throw std::out_of_range.
    template <typename T, typename = std::enable_if_t<std::is_integral<T>::value and
                                                      not std::is_same<T, bool>::value> >
    Value(T n) : v(to_int64(n)) {}
    Value(bool) = delete;
    Value(double x) : v(x) {}
    Value(list_t items);
    Value(object_t nodes);

    static Value list(list_t items = {});
    static Value object(object_t nodes = {});

    TYPE type() const noexcept { return static_cast<TYPE>(v.index()); }

    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_int() const noexcept { return std::holds_alternative<int64_t>(v); }
    bool is_float() const noexcept { return std::holds_alternative<double>(v); }
    bool is_list() const noexcept { return std::holds_alternative<list_t>(v); }
    bool is_object() const noexcept { return std::holds_alternative<object_t>(v); }

    // Throw std::bad_variant_access when the Value holds another variant.
    const std::string& as_string() const { return std::get<std::string>(v); }
    int64_t as_int() const { return std::get<int64_t>(v); }
    double as_float() const { return std::get<double>(v); }
    const list_t& as_list() const { return std::get<list_t>(v); }
    const object_t& as_object() const { return std::get<object_t>(v); }

    // Element count of a List or Object; 0 for scalars.
    size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    // List element, or the value of the idx-th node of an Object.
    const Value& at(size_t idx) const;
    const Value& operator[](size_t idx) const { return at(idx); }

    // Object lookups. Keys may repeat; count() and find_all() see every node
    // with the key, while at() refuses to choose between duplicates and
    // throws std::runtime_error("duplicate key ...") instead.
    size_t count(const std::string& key) const noexcept;
    bool has(const std::string& key) const noexcept { return count(key) > 0; }
    bool contains(const std::string& key) const noexcept { return has(key); }
    const Value& at(const std::string& key) const;
    const Value& operator[](const std::string& key) const { return at(key); }
    std::vector<const Value*> find_all(const std::string& key) const;
    std::vector<std::string> keys() const;

    // Compact BON text; dump(indent) pretty-prints with the given width.
    std::string dump() const;
    std::string dump(int indent) const;

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

  private:
    template <typename T>
    static int64_t to_int64(T n) {
        if (std::is_unsigned<T>::value and static_cast<uint64_t>(n) > uint64_t(INT64_MAX))
            throw std::out_of_range("integer does not fit in 64 bits");
        return static_cast<int64_t>(n);
    }
};

struct Node {
    std::string key;
    Value value;
};

bool operator==(const Node& lhs, const Node& rhs);
inline bool operator!=(const Node& lhs, const Node& rhs) { return not(lhs == rhs); }

// Structural comparison: same variant, same content, same order for Lists
// and Objects (including repeated keys).
bool deep_equals(const Value& a, const Value& b);

const char* type_name(Value::TYPE type) noexcept;

std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace bon
