#include "geometry.h"
#include "fields.h"

#include <utility>
#include <vector>

namespace kisexpr {

Point Point::from_node(const Node& token) {
    return {safe_get_float(token, 1), safe_get_float(token, 2)};
}

Node Point::to_node() const {
    return Node::token("xy", {Node::floating(x), Node::floating(y)});
}

Position Position::from_node(const Node& token) {
    Position pos;
    if (!token.is_list() || token.size() < 2) return pos;

    // (offset (xyz X Y Z))
    const Node& first = token[1];
    if (first.is_token("xyz")) {
        pos.x = safe_get_float(first, 1);
        pos.y = safe_get_float(first, 2);
        pos.z = safe_get_float(first, 3);
        return pos;
    }

    pos.x = safe_get_float(token, 1);
    pos.y = safe_get_float(token, 2);
    pos.angle = safe_get_float(token, 3);
    return pos;
}

Node Position::to_node(const std::string& token) const {
    if (z) {
        return Node::token(token, {Node::token("xyz", {Node::floating(x), Node::floating(y),
                                                       Node::floating(*z)})});
    }
    std::vector<Node> args = {Node::floating(x), Node::floating(y)};
    if (angle != 0.0) {
        args.push_back(Node::floating(angle));
    }
    return Node::token(token, std::move(args));
}

} // namespace kisexpr
