#include <bon/parser.h>
#include <bon/lexer.h>
#include <bon/number.h>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bon {

namespace {
    std::string join_expected(const std::vector<std::string>& expected) {
        std::string out;
        for (size_t k = 0; k < expected.size(); ++k) {
            if (k > 0) out += (k + 1 == expected.size()) ? " or " : ", ";
            out += expected[k];
        }
        return out;
    }

    struct Parser {
        const std::string& s;
        const ParseOptions& options;
        Lexer lexer;

        struct Opener {
            char ch;
            SourcePos pos;
        };
        std::vector<Opener> opener_stack;

        Parser(const std::string& str, const ParseOptions& opts) : s(str), options(opts), lexer(str) {}

        [[noreturn]] void fail(ErrorKind kind, const std::string& message, const Token& at,
                               std::vector<std::string> expected = {}) const {
            std::string note;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                std::ostringstream ss;
                ss << "('" << o.ch << "' opened at line " << o.pos.line << ", column " << o.pos.column << ")";
                note = ss.str();
            }
            throw ParseError(kind, message, at.pos, std::move(expected), describe(at),
                             format_diagnostic(s, message, at.pos, note));
        }

        [[noreturn]] void unexpected(const Token& tok, std::vector<std::string> expected,
                                     const std::string& context) const {
            std::string msg = "expected " + join_expected(expected);
            if (not context.empty()) msg += " " + context;
            msg += ", found " + describe(tok);
            ErrorKind kind = tok.type == TokenType::End ? ErrorKind::UnexpectedEndOfInput : ErrorKind::UnexpectedToken;
            fail(kind, msg, tok, std::move(expected));
        }

        Token expect(TokenType type, const std::string& context) {
            Token t = lexer.next();
            if (t.type != type) unexpected(t, {describe(type)}, context);
            return t;
        }

        void push_opener(const Token& open) {
            if (opener_stack.size() >= options.max_depth)
                fail(ErrorKind::UnexpectedToken, "maximum nesting depth exceeded", open);
            opener_stack.push_back(Opener{open.text[0], open.pos});
        }
        void pop_opener() {
            if (opener_stack.empty()) return;
            opener_stack.pop_back();
        }

        Value parse_value() {
            Token t = lexer.next();
            switch (t.type) {
                case TokenType::String:
                    return Value(std::move(t.text));
                case TokenType::Number:
                    return parse_number(t);
                case TokenType::LBracket:
                    return parse_list(t);
                case TokenType::LBrace:
                    return parse_object(t);
                default:
                    unexpected(t, {"value"}, "");
            }
        }

        Value parse_number(const Token& t) {
            try {
                if (classify_number(t.text) == NumberKind::Integer) return Value(integer_value(t.text));
                return Value(float_value(t.text));
            } catch (const std::out_of_range&) {
                fail(ErrorKind::IntegerOverflow, "integer literal " + t.text + " does not fit in 64 bits", t);
            } catch (const std::invalid_argument&) {
                fail(ErrorKind::InvalidNumberLiteral, "invalid number literal " + t.text, t);
            }
        }

        Value parse_list(const Token& open) {
            push_opener(open);
            Value::list_t items;
            if (lexer.peek().type == TokenType::RBracket) {
                lexer.next();
                pop_opener();
                return Value(std::move(items));
            }
            while (true) {
                items.push_back(parse_value());
                Token t = lexer.next();
                if (t.type == TokenType::RBracket) break;
                if (t.type == TokenType::Comma) {
                    const Token& after = lexer.peek();
                    if (after.type == TokenType::RBracket)
                        fail(ErrorKind::UnexpectedToken, "trailing comma before ']'", after, {"value"});
                    continue;
                }
                unexpected(t, {"','", "']'"}, "after list element");
            }
            pop_opener();
            return Value(std::move(items));
        }

        Value parse_object(const Token& open) {
            push_opener(open);
            Value::object_t nodes;
            while (true) {
                Token t = lexer.next();
                if (t.type == TokenType::RBrace) break;
                if (t.type == TokenType::Number or t.type == TokenType::String) {
                    std::string why = t.type == TokenType::Number ? "keys cannot be numbers"
                                                                  : "keys must be unquoted identifiers";
                    fail(ErrorKind::InvalidKey, "invalid key " + describe(t) + ": " + why, t,
                         {"identifier", "'}'"});
                }
                if (t.type != TokenType::Identifier) unexpected(t, {"identifier", "'}'"}, "in object");

                std::string key = std::move(t.text);
                expect(TokenType::Colon, "after key '" + key + "'");
                Value v = parse_value();
                expect(TokenType::Semicolon, "after value of '" + key + "'");
                nodes.push_back(Node{std::move(key), std::move(v)});
            }
            pop_opener();
            return Value(std::move(nodes));
        }

        Value parse_document() {
            Value v = parse_value();
            Token t = lexer.next();
            if (t.type != TokenType::End)
                fail(ErrorKind::UnexpectedToken, "unexpected " + describe(t) + " after document value", t,
                     {"end of input"});
            return v;
        }
    };
}

Value parse(const std::string& text, const ParseOptions& options) {
    Parser p(text, options);
    try {
        Value v = p.parse_document();
        if (options.verbose) std::cerr << "[bon] parsed " << type_name(v.type()) << " (" << v.size() << " elements)\n";
        return v;
    } catch (const ParseError& e) {
        if (options.verbose) std::cerr << "[bon] " << to_string(e.kind()) << ": " << e.what() << "\n";
        throw;
    }
}

ParseResult try_parse(const std::string& text, const ParseOptions& options) {
    ParseResult result;
    try {
        result.value = parse(text, options);
    } catch (const ParseError& e) {
        result.error = e;
    }
    return result;
}

}  // namespace bon
