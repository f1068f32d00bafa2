#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace bon {

enum class ErrorKind {
    UnterminatedString,
    InvalidNumberLiteral,
    IntegerOverflow,
    UnexpectedToken,
    UnexpectedEndOfInput,
    InvalidKey
};

const char* to_string(ErrorKind kind) noexcept;

// Position of a character in the source text. Line and column are 1-based,
// the column counts bytes.
struct SourcePos {
    size_t offset = 0;
    size_t line = 1;
    size_t column = 1;
};

// Thrown by the lexer and parser on the first malformed construct.
// what() holds the full diagnostic (message, position, offending source line
// and a caret); message() holds only the short description.
class ParseError : public std::runtime_error {
  public:
    ParseError(ErrorKind kind, const std::string& message, SourcePos pos,
               std::vector<std::string> expected = {}, std::string found = {},
               const std::string& diagnostic = {});

    ErrorKind kind() const noexcept { return kind_; }
    size_t line() const noexcept { return pos_.line; }
    size_t column() const noexcept { return pos_.column; }
    size_t byte_offset() const noexcept { return pos_.offset; }
    SourcePos position() const noexcept { return pos_; }
    const std::string& message() const noexcept { return message_; }
    const std::vector<std::string>& expected() const noexcept { return expected_; }
    const std::string& found() const noexcept { return found_; }

  private:
    ErrorKind kind_;
    std::string message_;
    SourcePos pos_;
    std::vector<std::string> expected_;
    std::string found_;
};

// Builds the multi-line diagnostic used as ParseError::what():
//   <message> (line L, column C)
//   <source line>
//       ^
// An optional note is appended on its own line.
std::string format_diagnostic(const std::string& text, const std::string& message, SourcePos pos,
                              const std::string& note = {});

}  // namespace bon
