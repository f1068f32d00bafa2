#include <bon/serializer.h>
#include <bon/number.h>
#include <cctype>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace bon {

std::string quote_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"' or c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

bool is_identifier(const std::string& key) noexcept {
    if (key.empty()) return false;
    unsigned char first = static_cast<unsigned char>(key[0]);
    if (not(std::isalpha(first) or first == '_')) return false;
    for (char c : key)
        if (not(std::isalnum(static_cast<unsigned char>(c)) or c == '_')) return false;
    return true;
}

std::string serialize(const Value& value, const SerializeOptions& options) {
    std::ostringstream out;
    const bool pretty = options.pretty;
    const int width = options.indent_width > 0 ? options.indent_width : 0;

    auto indent_spaces = [&](int n) {
        for (int i = 0; i < n; ++i) out.put(' ');
    };

    // scalars and empty containers never need a line of their own
    auto is_simple = [](const Value& v) {
        return not(v.is_list() or v.is_object()) or v.empty();
    };

    std::function<void(const Value&, int)> emit;
    emit = [&](const Value& val, int indent) {
        switch (val.type()) {
            case Value::String:
                out << quote_string(val.as_string());
                break;
            case Value::Integer:
                out << integer_literal(val.as_int());
                break;
            case Value::Float:
                out << float_literal(val.as_float());
                break;
            case Value::List: {
                const auto& L = val.as_list();
                if (L.empty()) {
                    out << "[]";
                    break;
                }
                bool all_simple = true;
                for (auto const& e : L)
                    if (not is_simple(e)) {
                        all_simple = false;
                        break;
                    }

                if (not pretty or all_simple) {
                    out << '[';
                    for (size_t i = 0; i < L.size(); ++i) {
                        if (i) out << (pretty ? ", " : ",");
                        emit(L[i], indent);
                    }
                    out << ']';
                } else {
                    out << "[\n";
                    for (size_t i = 0; i < L.size(); ++i) {
                        indent_spaces(indent + width);
                        emit(L[i], indent + width);
                        if (i + 1 < L.size()) out << ',';
                        out << '\n';
                    }
                    indent_spaces(indent);
                    out << ']';
                }
                break;
            }
            case Value::Object: {
                const auto& O = val.as_object();
                if (O.empty()) {
                    out << "{}";
                    break;
                }
                out << '{';
                if (pretty) out << '\n';
                for (auto const& node : O) {
                    if (not is_identifier(node.key))
                        throw std::invalid_argument("object key '" + node.key + "' is not a valid identifier");
                    if (pretty) indent_spaces(indent + width);
                    out << node.key << (pretty ? ": " : ":");
                    emit(node.value, indent + width);
                    out << ';';
                    if (pretty) out << '\n';
                }
                if (pretty) indent_spaces(indent);
                out << '}';
                break;
            }
        }
    };

    emit(value, 0);
    return out.str();
}

}  // namespace bon
