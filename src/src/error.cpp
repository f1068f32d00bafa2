#include <bon/error.h>
#include <sstream>
#include <utility>

namespace bon {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnterminatedString:
            return "UnterminatedString";
        case ErrorKind::InvalidNumberLiteral:
            return "InvalidNumberLiteral";
        case ErrorKind::IntegerOverflow:
            return "IntegerOverflow";
        case ErrorKind::UnexpectedToken:
            return "UnexpectedToken";
        case ErrorKind::UnexpectedEndOfInput:
            return "UnexpectedEndOfInput";
        case ErrorKind::InvalidKey:
            return "InvalidKey";
    }
    return "Unknown";
}

ParseError::ParseError(ErrorKind kind, const std::string& message, SourcePos pos,
                       std::vector<std::string> expected, std::string found,
                       const std::string& diagnostic)
    : std::runtime_error(diagnostic.empty() ? message : diagnostic),
      kind_(kind),
      message_(message),
      pos_(pos),
      expected_(std::move(expected)),
      found_(std::move(found)) {}

std::string format_diagnostic(const std::string& text, const std::string& message, SourcePos pos,
                              const std::string& note) {
    size_t at = pos.offset < text.size() ? pos.offset : text.size();
    size_t line_start = at;
    while (line_start > 0 and text[line_start - 1] != '\n') --line_start;
    size_t line_end = at;
    while (line_end < text.size() and text[line_end] != '\n') ++line_end;
    std::string line_text = text.substr(line_start, line_end - line_start);
    if (not line_text.empty() and line_text.back() == '\r') line_text.pop_back();

    // tabs are kept in the caret line so it lines up with the source line
    std::string caret;
    for (size_t k = line_start; k < at; ++k) caret.push_back(text[k] == '\t' ? '\t' : ' ');
    caret.push_back('^');

    std::ostringstream ss;
    ss << message << " (line " << pos.line << ", column " << pos.column << ")\n";
    ss << line_text << "\n" << caret;
    if (not note.empty()) ss << "\n" << note;
    return ss.str();
}

}  // namespace bon
