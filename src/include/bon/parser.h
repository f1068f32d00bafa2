#pragma once

#include <bon/error.h>
#include <bon/value.h>
#include <cstddef>
#include <optional>
#include <string>

namespace bon {

struct ParseOptions {
    // Print the diagnostic of a failed parse to std::cerr before it is reported.
    bool verbose = false;
    // Lists and Objects nested deeper than this are rejected.
    size_t max_depth = 512;
};

// Parse a complete BON document. Any Value is accepted at the top level.
// Throws bon::ParseError on the first error; no partial tree is returned.
Value parse(const std::string& text, const ParseOptions& options = {});

// Non-throwing form of parse(): exactly one of value / error is set.
struct ParseResult {
    std::optional<Value> value;
    std::optional<ParseError> error;

    explicit operator bool() const noexcept { return value.has_value(); }
};

ParseResult try_parse(const std::string& text, const ParseOptions& options = {});

namespace literals {
    inline Value operator"" _bon(const char* s, std::size_t len) {
        return parse(std::string(s, len));
    }
}

}  // namespace bon
