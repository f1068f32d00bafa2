#include <bon/lexer.h>
#include <cctype>

namespace bon {

namespace {
    bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
    bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) or c == '_'; }
    bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) or c == '_'; }

    std::string quote_char(char c) {
        if (c == '\'') return "\"'\"";
        return std::string("'") + c + "'";
    }
}

std::string describe(TokenType type) {
    switch (type) {
        case TokenType::String:
            return "string";
        case TokenType::Number:
            return "number";
        case TokenType::Identifier:
            return "identifier";
        case TokenType::LBrace:
            return "'{'";
        case TokenType::RBrace:
            return "'}'";
        case TokenType::LBracket:
            return "'['";
        case TokenType::RBracket:
            return "']'";
        case TokenType::Colon:
            return "':'";
        case TokenType::Semicolon:
            return "';'";
        case TokenType::Comma:
            return "','";
        case TokenType::End:
            return "end of input";
    }
    return "token";
}

std::string describe(const Token& token) {
    switch (token.type) {
        case TokenType::String:
            return "string \"" + token.text + "\"";
        case TokenType::Number:
            return "number " + token.text;
        case TokenType::Identifier:
            return "identifier '" + token.text + "'";
        default:
            return describe(token.type);
    }
}

char Lexer::get() {
    if (i_ >= text_.size()) return '\0';
    char c = text_[i_++];
    if (c == '\n') {
        ++line_;
        col_ = 1;
    } else
        ++col_;
    return c;
}

void Lexer::skip_ws() {
    while (not at_end() and std::isspace(static_cast<unsigned char>(cur()))) get();
}

void Lexer::fail(ErrorKind kind, const std::string& message, SourcePos pos,
                 const std::string& found) const {
    throw ParseError(kind, message, pos, {}, found, format_diagnostic(text_, message, pos));
}

const Token& Lexer::peek() {
    if (not lookahead_) lookahead_ = scan();
    return *lookahead_;
}

Token Lexer::next() {
    if (lookahead_) {
        Token t = std::move(*lookahead_);
        lookahead_.reset();
        return t;
    }
    return scan();
}

void Lexer::reset() {
    i_ = 0;
    line_ = 1;
    col_ = 1;
    lookahead_.reset();
}

Token Lexer::scan() {
    skip_ws();
    SourcePos start = here();
    if (at_end()) return Token{TokenType::End, {}, start};

    char c = cur();
    auto punct = [&](TokenType type) {
        get();
        return Token{type, std::string(1, c), start};
    };
    switch (c) {
        case '{':
            return punct(TokenType::LBrace);
        case '}':
            return punct(TokenType::RBrace);
        case '[':
            return punct(TokenType::LBracket);
        case ']':
            return punct(TokenType::RBracket);
        case ':':
            return punct(TokenType::Colon);
        case ';':
            return punct(TokenType::Semicolon);
        case ',':
            return punct(TokenType::Comma);
        case '"':
        case '\'':
            return scan_string();
        default:
            break;
    }
    if (c == '-' or is_digit(c)) return scan_number();
    if (is_ident_start(c)) return scan_identifier();
    if (c == '.' and i_ + 1 < text_.size() and is_digit(text_[i_ + 1]))
        fail(ErrorKind::InvalidNumberLiteral, "number literal must start with a digit", start, ".");
    fail(ErrorKind::UnexpectedToken, "unexpected character " + quote_char(c), start, std::string(1, c));
}

Token Lexer::scan_string() {
    SourcePos start = here();
    char quote = get();
    std::string out;
    while (true) {
        if (at_end()) fail(ErrorKind::UnterminatedString, "unterminated string", start);
        char c = get();
        if (c == quote) break;
        if (c == '\\') {
            if (at_end()) fail(ErrorKind::UnterminatedString, "unterminated string", start);
            out.push_back(get());
            continue;
        }
        out.push_back(c);
    }
    return Token{TokenType::String, std::move(out), start};
}

Token Lexer::scan_number() {
    SourcePos start = here();
    auto literal = [&]() { return text_.substr(start.offset, i_ - start.offset); };
    auto invalid = [&](const std::string& why) {
        // include the offending character in what is reported as found
        size_t end = at_end() ? i_ : i_ + 1;
        fail(ErrorKind::InvalidNumberLiteral, "invalid number literal: " + why, start,
             text_.substr(start.offset, end - start.offset));
    };

    if (cur() == '-') get();
    if (not is_digit(cur())) invalid("expected a digit after '-'");
    while (is_digit(cur())) get();

    bool has_dot = false;
    if (cur() == '.') {
        has_dot = true;
        get();
        if (not is_digit(cur())) invalid("expected a digit after '.'");
        while (is_digit(cur())) get();
    }
    if (cur() == 'e' or cur() == 'E') {
        get();
        if (cur() == '+' or cur() == '-') get();
        if (not is_digit(cur())) invalid("expected a digit in exponent");
        while (is_digit(cur())) get();
    }
    if (cur() == 'f' or cur() == 'F') {
        if (has_dot) invalid("a literal with a decimal point cannot take an 'f' suffix");
        get();
    }
    if (cur() == '.') invalid(has_dot ? "multiple decimal points" : "unexpected '.'");
    return Token{TokenType::Number, literal(), start};
}

Token Lexer::scan_identifier() {
    SourcePos start = here();
    while (is_ident_char(cur())) get();
    return Token{TokenType::Identifier, text_.substr(start.offset, i_ - start.offset), start};
}

std::vector<Token> tokenize(const std::string& text) {
    Lexer lexer(text);
    std::vector<Token> out;
    while (true) {
        out.push_back(lexer.next());
        if (out.back().type == TokenType::End) break;
    }
    return out;
}

}  // namespace bon
