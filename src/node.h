#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kisexpr {

// Generic S-expression tree value: one of four atom kinds or a list.
// Children of a list are fixed at construction; trees are built, not edited.
class Node {
public:
    enum Kind { SYMBOL, STRING, INTEGER, FLOAT, LIST };

    // Default-constructed node is the empty list "()".
    Node() = default;

    static Node symbol(std::string text);
    static Node quoted(std::string text);
    static Node integer(int64_t value);
    static Node floating(double value);
    static Node list(std::vector<Node> children = {});

    // Named list: (name args...)
    static Node token(const std::string& name, std::vector<Node> args = {});

    Kind kind() const { return kind_; }
    bool is_list() const { return kind_ == LIST; }
    bool is_atom() const { return kind_ != LIST; }
    bool is_symbol() const { return kind_ == SYMBOL; }
    bool is_string() const { return kind_ == STRING; }
    bool is_integer() const { return kind_ == INTEGER; }
    bool is_float() const { return kind_ == FLOAT; }
    bool is_number() const { return kind_ == INTEGER || kind_ == FLOAT; }

    // True for Symbol(name) only, never for a String with the same text.
    bool is_symbol(const std::string& name) const;

    // True for a list whose first child is Symbol(name).
    bool is_token(const std::string& name) const;

    // Text of a Symbol or String; empty for other kinds.
    const std::string& text() const { return text_; }
    int64_t int_value() const { return int_; }
    double float_value() const { return float_; }

    const std::vector<Node>& children() const { return children_; }
    size_t size() const { return children_.size(); }
    bool empty() const { return children_.empty(); }
    const Node& operator[](size_t i) const { return children_[i]; }
    std::vector<Node>::const_iterator begin() const { return children_.begin(); }
    std::vector<Node>::const_iterator end() const { return children_.end(); }

    // Head symbol text of a named list, empty otherwise.
    std::string head_name() const;

    // Structural, order-sensitive equality. Integer 1 != Float 1.0 and
    // Symbol a != String "a".
    bool operator==(const Node& o) const;
    bool operator!=(const Node& o) const { return !(*this == o); }

private:
    Kind kind_ = LIST;
    std::string text_;
    int64_t int_ = 0;
    double float_ = 0.0;
    std::vector<Node> children_;
};

const char* kind_name(Node::Kind kind);

} // namespace kisexpr
