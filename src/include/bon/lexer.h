#pragma once

#include <bon/error.h>
#include <optional>
#include <string>
#include <vector>

namespace bon {

enum class TokenType {
    String,
    Number,
    Identifier,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Semicolon,
    Comma,
    End
};

struct Token {
    TokenType type = TokenType::End;
    // String: unescaped content. Number: raw literal. Identifier: the name.
    // Punctuation: the character itself. End: empty.
    std::string text;
    SourcePos pos;
};

// Short human-readable name used in diagnostics, e.g. "';'" or "identifier".
std::string describe(TokenType type);
std::string describe(const Token& token);

// Produces tokens on demand. The lexer keeps a reference to the text, which
// must outlive it. reset() restarts the scan from the first byte.
class Lexer {
  public:
    explicit Lexer(const std::string& text) : text_(text) {}
    Lexer(std::string&&) = delete;

    Token next();
    const Token& peek();
    void reset();

    const std::string& text() const noexcept { return text_; }

  private:
    char cur() const { return i_ < text_.size() ? text_[i_] : '\0'; }
    bool at_end() const { return i_ >= text_.size(); }
    char get();
    void skip_ws();
    SourcePos here() const { return SourcePos{i_, line_, col_}; }

    Token scan();
    Token scan_string();
    Token scan_number();
    Token scan_identifier();

    [[noreturn]] void fail(ErrorKind kind, const std::string& message, SourcePos pos,
                           const std::string& found = {}) const;

    const std::string& text_;
    size_t i_ = 0;
    size_t line_ = 1;
    size_t col_ = 1;
    std::optional<Token> lookahead_;
};

// Lex the whole input; the last token is always End.
std::vector<Token> tokenize(const std::string& text);

}  // namespace bon
