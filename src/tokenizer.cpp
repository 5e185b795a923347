#include "tokenizer.h"
#include "errors.h"
#include "utils.h"

#include <utility>

namespace kisexpr {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool is_control(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return (u < 0x20 && !is_space(c)) || u == 0x7F;
}

static bool is_delimiter(char c) {
    return is_space(c) || c == '(' || c == ')' || c == '"';
}

const char* token_type_name(Token::Type type) {
    switch (type) {
        case Token::OPEN_PAREN:  return "'('";
        case Token::CLOSE_PAREN: return "')'";
        case Token::SYMBOL:      return "symbol";
        case Token::STRING:      return "string";
        case Token::NUMBER:      return "number";
        case Token::END:         return "end of input";
    }
    return "token";
}

Tokenizer::Tokenizer(const std::string& text)
    : text_(text) {}

void Tokenizer::advance() {
    if (text_[pos_] == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

void Tokenizer::skip_whitespace() {
    while (pos_ < text_.size() && is_space(text_[pos_])) {
        advance();
    }
}

Token Tokenizer::next() {
    skip_whitespace();

    Token tok;
    tok.line = line_;
    tok.column = column_;

    if (pos_ >= text_.size()) {
        tok.type = Token::END;
        return tok;
    }

    char c = text_[pos_];
    if (c == '(') {
        advance();
        tok.type = Token::OPEN_PAREN;
        return tok;
    }
    if (c == ')') {
        advance();
        tok.type = Token::CLOSE_PAREN;
        return tok;
    }
    if (c == '"') {
        return read_string(tok.line, tok.column);
    }
    return read_atom(tok.line, tok.column);
}

Token Tokenizer::read_string(int line, int column) {
    Token tok;
    tok.type = Token::STRING;
    tok.line = line;
    tok.column = column;

    advance(); // opening quote
    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (c == '"') {
            advance();
            return tok;
        }
        if (c == '\\') {
            advance();
            if (pos_ >= text_.size()) break;
            char e = text_[pos_];
            switch (e) {
                case '"':  tok.value += '"';  break;
                case '\\': tok.value += '\\'; break;
                case 'n':  tok.value += '\n'; break;
                case 'r':  tok.value += '\r'; break;
                case 't':  tok.value += '\t'; break;
                default:
                    // Unknown escapes are kept verbatim
                    tok.value += '\\';
                    tok.value += e;
            }
            advance();
            continue;
        }
        tok.value += c;
        advance();
    }
    throw SyntaxError(SyntaxError::UNTERMINATED_STRING,
                      "unterminated string", line, column);
}

Token Tokenizer::read_atom(int line, int column) {
    Token tok;
    tok.line = line;
    tok.column = column;

    size_t start = pos_;
    while (pos_ < text_.size() && !is_delimiter(text_[pos_])) {
        if (is_control(text_[pos_])) {
            throw SyntaxError(SyntaxError::INVALID_CHARACTER,
                              "invalid character code " +
                                  std::to_string(static_cast<unsigned char>(text_[pos_])),
                              line_, column_);
        }
        advance();
    }
    tok.value = text_.substr(start, pos_ - start);
    tok.type = is_number_literal(tok.value) ? Token::NUMBER : Token::SYMBOL;
    return tok;
}

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    Tokenizer tz(text);
    for (Token t = tz.next(); t.type != Token::END; t = tz.next()) {
        tokens.push_back(std::move(t));
    }
    return tokens;
}

} // namespace kisexpr
