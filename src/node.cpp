#include "node.h"

#include <utility>

namespace kisexpr {

Node Node::symbol(std::string text) {
    Node n;
    n.kind_ = SYMBOL;
    n.text_ = std::move(text);
    return n;
}

Node Node::quoted(std::string text) {
    Node n;
    n.kind_ = STRING;
    n.text_ = std::move(text);
    return n;
}

Node Node::integer(int64_t value) {
    Node n;
    n.kind_ = INTEGER;
    n.int_ = value;
    return n;
}

Node Node::floating(double value) {
    Node n;
    n.kind_ = FLOAT;
    n.float_ = value;
    return n;
}

Node Node::list(std::vector<Node> children) {
    Node n;
    n.kind_ = LIST;
    n.children_ = std::move(children);
    return n;
}

Node Node::token(const std::string& name, std::vector<Node> args) {
    std::vector<Node> children;
    children.reserve(args.size() + 1);
    children.push_back(symbol(name));
    for (auto& a : args) {
        children.push_back(std::move(a));
    }
    return list(std::move(children));
}

bool Node::is_symbol(const std::string& name) const {
    return kind_ == SYMBOL && text_ == name;
}

bool Node::is_token(const std::string& name) const {
    return kind_ == LIST && !children_.empty() && children_[0].is_symbol(name);
}

std::string Node::head_name() const {
    if (kind_ == LIST && !children_.empty() && children_[0].kind_ == SYMBOL) {
        return children_[0].text_;
    }
    return "";
}

bool Node::operator==(const Node& o) const {
    if (kind_ != o.kind_) return false;
    switch (kind_) {
        case SYMBOL:
        case STRING:
            return text_ == o.text_;
        case INTEGER:
            return int_ == o.int_;
        case FLOAT:
            return float_ == o.float_;
        case LIST:
            return children_ == o.children_;
    }
    return false;
}

const char* kind_name(Node::Kind kind) {
    switch (kind) {
        case Node::SYMBOL:  return "symbol";
        case Node::STRING:  return "string";
        case Node::INTEGER: return "integer";
        case Node::FLOAT:   return "float";
        case Node::LIST:    return "list";
    }
    return "unknown";
}

} // namespace kisexpr
