#include "node_json.h"
#include "errors.h"

#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace kisexpr {

static const char* SYMBOL_KEY = "symbol";

json to_json(const Node& node) {
    switch (node.kind()) {
        case Node::SYMBOL:
            return json{{SYMBOL_KEY, node.text()}};
        case Node::STRING:
            return json(node.text());
        case Node::INTEGER:
            return json(node.int_value());
        case Node::FLOAT:
            return json(node.float_value());
        case Node::LIST:
            break;
    }
    json arr = json::array();
    for (const auto& child : node) {
        arr.push_back(to_json(child));
    }
    return arr;
}

static Node from_json_at(const json& j, int depth, int max_depth) {
    switch (j.type()) {
        case json::value_t::array: {
            if (depth + 1 > max_depth) {
                throw ParseError(ParseError::NESTING_TOO_DEEP,
                                 "JSON nesting deeper than " + std::to_string(max_depth) +
                                     " levels",
                                 0, 0);
            }
            std::vector<Node> children;
            children.reserve(j.size());
            for (const auto& item : j) {
                children.push_back(from_json_at(item, depth + 1, max_depth));
            }
            return Node::list(std::move(children));
        }
        case json::value_t::string:
            return Node::quoted(j.get<std::string>());
        case json::value_t::number_integer:
            return Node::integer(j.get<int64_t>());
        case json::value_t::number_unsigned: {
            auto v = j.get<uint64_t>();
            if (v > static_cast<uint64_t>(INT64_MAX)) {
                throw SexprError("integer " + std::to_string(v) + " is out of range");
            }
            return Node::integer(static_cast<int64_t>(v));
        }
        case json::value_t::number_float:
            return Node::floating(j.get<double>());
        case json::value_t::object:
            if (j.size() == 1 && j.contains(SYMBOL_KEY)) {
                return Node::symbol(j.at(SYMBOL_KEY).get<std::string>());
            }
            break;
        default:
            break;
    }
    throw SexprError(std::string("unsupported JSON value of type ") + j.type_name());
}

Node from_json(const json& j, int max_depth) {
    return from_json_at(j, 0, max_depth);
}

void write_json(std::ostream& out, const Node& node, int indent) {
    out << to_json(node).dump(indent) << "\n";
}

bool read_json(std::istream& in, Node& node, int max_depth) {
    try {
        json j = json::parse(in);
        node = from_json(j, max_depth);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "JSON parse error: " << e.what() << "\n";
        return false;
    } catch (const SexprError& e) {
        std::cerr << "JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_json(const std::string& json_text, Node& node, int max_depth) {
    std::istringstream iss(json_text);
    return read_json(iss, node, max_depth);
}

} // namespace kisexpr
