#include "parser.h"
#include "errors.h"
#include "utils.h"

#include <utility>

namespace kisexpr {

namespace {

// Replays a pre-tokenized stream, then END forever.
class VectorSource {
public:
    explicit VectorSource(const std::vector<Token>& tokens)
        : tokens_(tokens) {}

    Token next() {
        if (index_ < tokens_.size()) return tokens_[index_++];
        Token end;
        end.type = Token::END;
        if (!tokens_.empty()) {
            end.line = tokens_.back().line;
            end.column = tokens_.back().column;
        }
        return end;
    }

private:
    const std::vector<Token>& tokens_;
    size_t index_ = 0;
};

template <typename Source>
class RecursiveParser {
public:
    RecursiveParser(Source& src, const ParseOptions& opts)
        : src_(src), opts_(opts) {}

    Node parse_document() {
        Token first = src_.next();
        if (first.type == Token::END) {
            throw ParseError(ParseError::UNEXPECTED_TOKEN,
                             "unexpected end of input", first.line, first.column);
        }
        Node root = parse_expr(first, 0);

        Token trailing = src_.next();
        if (trailing.type != Token::END) {
            throw ParseError(ParseError::UNEXPECTED_TOKEN,
                             std::string("unexpected ") + token_type_name(trailing.type) +
                                 " after the top-level expression",
                             trailing.line, trailing.column);
        }
        return root;
    }

private:
    Source& src_;
    ParseOptions opts_;

    Node parse_expr(const Token& tok, int depth) {
        switch (tok.type) {
            case Token::OPEN_PAREN:
                return parse_list(tok, depth + 1);
            case Token::CLOSE_PAREN:
                throw ParseError(ParseError::UNEXPECTED_TOKEN,
                                 "unexpected ')' with no matching '('",
                                 tok.line, tok.column);
            case Token::NUMBER:
                return number_node(tok.value);
            case Token::STRING:
                return Node::quoted(tok.value);
            case Token::SYMBOL:
                return Node::symbol(tok.value);
            case Token::END:
                break;
        }
        throw ParseError(ParseError::UNEXPECTED_TOKEN,
                         "unexpected end of input", tok.line, tok.column);
    }

    Node parse_list(const Token& open, int depth) {
        if (depth > opts_.max_depth) {
            throw ParseError(ParseError::NESTING_TOO_DEEP,
                             "nesting deeper than " + std::to_string(opts_.max_depth) + " levels",
                             open.line, open.column);
        }

        std::vector<Node> children;
        for (;;) {
            Token tok = src_.next();
            if (tok.type == Token::END) {
                throw ParseError(ParseError::UNTERMINATED_LIST,
                                 "list is never closed", open.line, open.column);
            }
            if (tok.type == Token::CLOSE_PAREN) break;
            children.push_back(parse_expr(tok, depth));
        }
        return Node::list(std::move(children));
    }

    // Integers that overflow int64 and floats outside double range are kept
    // as symbols so their text survives a round trip.
    static Node number_node(const std::string& raw) {
        if (is_float_literal(raw)) {
            if (auto v = parse_double(raw)) return Node::floating(*v);
        } else {
            if (auto v = parse_int64(raw)) return Node::integer(*v);
        }
        return Node::symbol(raw);
    }
};

} // namespace

Node parse(Tokenizer& tokens, const ParseOptions& opts) {
    RecursiveParser<Tokenizer> parser(tokens, opts);
    return parser.parse_document();
}

Node parse(const std::vector<Token>& tokens, const ParseOptions& opts) {
    VectorSource src(tokens);
    RecursiveParser<VectorSource> parser(src, opts);
    return parser.parse_document();
}

Node parse(const std::string& text, const ParseOptions& opts) {
    Tokenizer tokens(text);
    return parse(tokens, opts);
}

Node parse_multi(const std::string& text, const ParseOptions& opts) {
    return parse(wrap_expressions(strip_comment_lines(text)), opts);
}

} // namespace kisexpr
