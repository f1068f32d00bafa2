#include <bon/number.h>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace bon {

NumberKind classify_number(const std::string& literal) noexcept {
    if (literal.find('.') != std::string::npos) return NumberKind::Float;
    if (literal.find_first_of("eE") != std::string::npos) return NumberKind::Float;
    if (not literal.empty() and (literal.back() == 'f' or literal.back() == 'F')) return NumberKind::Float;
    return NumberKind::Integer;
}

int64_t integer_value(const std::string& literal) {
    int64_t out = 0;
    const char* first = literal.data();
    const char* last = first + literal.size();
    auto res = std::from_chars(first, last, out);
    if (res.ec == std::errc::result_out_of_range)
        throw std::out_of_range("integer literal '" + literal + "' does not fit in 64 bits");
    if (res.ec != std::errc() or res.ptr != last)
        throw std::invalid_argument("not an integer literal: '" + literal + "'");
    return out;
}

namespace {
    // Decimal exponent of the most significant non-zero digit of a validated
    // float body, exponent part included. Saturates on huge exponents.
    long leading_exponent(const std::string& body) {
        size_t start = body[0] == '-' ? 1 : 0;
        size_t exp_at = body.find_first_of("eE");
        std::string mantissa = body.substr(start, exp_at == std::string::npos ? std::string::npos : exp_at - start);
        size_t dot = mantissa.find('.');
        size_t int_len = dot == std::string::npos ? mantissa.size() : dot;
        size_t first = mantissa.find_first_not_of("0.");
        long mag = 0;
        if (first != std::string::npos)
            mag = first < int_len ? static_cast<long>(int_len - first - 1) : -static_cast<long>(first - int_len);

        long exp = 0;
        if (exp_at != std::string::npos) {
            size_t k = exp_at + 1;
            bool negative = false;
            if (k < body.size() and (body[k] == '+' or body[k] == '-')) negative = body[k++] == '-';
            for (; k < body.size(); ++k) {
                if (exp < 100000) exp = exp * 10 + (body[k] - '0');
            }
            if (negative) exp = -exp;
        }
        return mag + exp;
    }
}

double float_value(const std::string& literal) {
    std::string body = literal;
    if (not body.empty() and (body.back() == 'f' or body.back() == 'F')) body.pop_back();
    if (body.empty()) throw std::invalid_argument("empty float literal");

    double d = 0.0;
    const char* first = body.data();
    const char* last = first + body.size();
    auto res = std::from_chars(first, last, d);
    if (res.ec == std::errc::result_out_of_range and res.ptr == last) {
        // overflow reads as infinity, underflow as zero, keeping the sign
        bool negative = body[0] == '-';
        if (leading_exponent(body) > 0) return negative ? -HUGE_VAL : HUGE_VAL;
        return negative ? -0.0 : 0.0;
    }
    if (res.ec != std::errc() or res.ptr != last)
        throw std::invalid_argument("not a float literal: '" + literal + "'");
    return d;
}

std::string integer_literal(int64_t n) {
    char buf[32];
    auto res = std::to_chars(buf, buf + sizeof(buf), n);
    return std::string(buf, res.ptr);
}

std::string float_literal(double x) {
    if (std::isnan(x)) throw std::domain_error("NaN has no BON representation");
    if (std::isinf(x)) return x < 0 ? "-1e999" : "1e999";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), x);
    std::string out(buf, res.ptr);
    if (out.find_first_of(".e") == std::string::npos) out += ".0";
    return out;
}

}  // namespace bon
