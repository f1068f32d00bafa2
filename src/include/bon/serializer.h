#pragma once

#include <bon/value.h>
#include <string>

namespace bon {

struct SerializeOptions {
    // Pretty mode puts each object node on its own line; compact mode emits
    // the whole document on one line without optional spaces.
    bool pretty = true;
    int indent_width = 4;
};

// Canonical BON text for a Value tree. Strings are always double-quoted,
// Floats always carry a '.' or an exponent.
// Throws std::invalid_argument for an object key that is not an identifier
// and std::domain_error for a NaN Float; trees produced by parse() never
// contain either.
std::string serialize(const Value& value, const SerializeOptions& options = {});

// Double-quoted form of a string with '"' and '\' escaped.
std::string quote_string(const std::string& s);

bool is_identifier(const std::string& key) noexcept;

}  // namespace bon
