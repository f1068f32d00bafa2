#pragma once

#include <cstdint>
#include <string>

namespace bon {

enum class NumberKind { Integer, Float };

// Decide what a well-formed Number literal denotes:
//   contains '.'            -> Float
//   contains 'e' or 'E'     -> Float
//   ends with 'f' or 'F'    -> Float
//   otherwise               -> Integer
NumberKind classify_number(const std::string& literal) noexcept;

// Throws std::out_of_range when the literal does not fit in int64_t and
// std::invalid_argument when it is not a plain decimal integer.
int64_t integer_value(const std::string& literal);

// Strips an 'f'/'F' suffix before converting. Literals beyond the double
// range become +/-infinity, those below it +/-0.0. Locale independent.
double float_value(const std::string& literal);

// Decimal text of an Integer, independent of the global locale.
std::string integer_literal(int64_t n);

// Shortest text that reads back as the same double, always carrying a '.' or
// an exponent so it never lexes as an Integer. Infinities are written as
// 1e999 / -1e999. Throws std::domain_error for NaN.
std::string float_literal(double x);

}  // namespace bon
