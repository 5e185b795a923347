#pragma once

#include <string>
#include <vector>

namespace kisexpr {

struct Token {
    enum Type { OPEN_PAREN, CLOSE_PAREN, SYMBOL, STRING, NUMBER, END };
    Type type = END;
    std::string value;  // raw text for SYMBOL/NUMBER, unescaped for STRING
    int line = 1;
    int column = 1;
};

const char* token_type_name(Token::Type type);

// Pull-based lexer over a copy of the input text.
// Once END is returned every further call returns END again.
class Tokenizer {
public:
    explicit Tokenizer(const std::string& text);

    // Next token; throws SyntaxError on an unterminated string or a control
    // character outside a string.
    Token next();

private:
    std::string text_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;

    void advance();
    void skip_whitespace();
    Token read_string(int line, int column);
    Token read_atom(int line, int column);
};

// Tokenize the whole text eagerly (END token not included).
std::vector<Token> tokenize(const std::string& text);

} // namespace kisexpr
