#include "records.h"
#include "fields.h"

#include <cmath>
#include <utility>

namespace kisexpr {

static const EnumEntry<StrokeType> stroke_types[] = {
    {"dash",         StrokeType::DASH},
    {"dash_dot",     StrokeType::DASH_DOT},
    {"dash_dot_dot", StrokeType::DASH_DOT_DOT},
    {"dot",          StrokeType::DOT},
    {"default",      StrokeType::DEFAULT},
    {"solid",        StrokeType::SOLID},
};

static const EnumEntry<FillType> fill_types[] = {
    {"none",       FillType::NONE},
    {"outline",    FillType::OUTLINE},
    {"background", FillType::BACKGROUND},
    {"color",      FillType::COLOR},
};

std::string stroke_type_name(StrokeType type) {
    return enum_name(type, stroke_types);
}

std::string fill_type_name(FillType type) {
    return enum_name(type, fill_types);
}

// KiCad writes a whole alpha as an integer: (color 0 0 0 0), (color 255 0 0 0.5)
static Node alpha_node(double a) {
    if (std::floor(a) == a && std::abs(a) < 1e15) {
        return Node::integer(static_cast<int64_t>(a));
    }
    return Node::floating(a);
}

// --- Stroke ---

Stroke Stroke::from_node(const Node& token) {
    Stroke s;
    if (!token.is_list() || token.empty()) return s;

    s.width = get_required_float(token, "width", 0.254);
    if (has_token(token, "type")) {
        s.type = get_enum(token, "type", stroke_types, StrokeType::SOLID);
    }

    const Node* color = find_token(token, "color");
    if (validate_token_length(color, 5)) {
        Color c;
        c.r = static_cast<int>(safe_get_int(*color, 1));
        c.g = static_cast<int>(safe_get_int(*color, 2));
        c.b = static_cast<int>(safe_get_int(*color, 3));
        c.a = safe_get_float(*color, 4);
        s.color = c;
    }
    return s;
}

Node Stroke::to_node() const {
    std::vector<Node> args;
    args.push_back(Node::token("width", {Node::floating(width)}));
    if (type) {
        args.push_back(Node::token("type", {Node::symbol(stroke_type_name(*type))}));
    }
    if (color) {
        args.push_back(Node::token("color", {Node::integer(color->r), Node::integer(color->g),
                                             Node::integer(color->b), alpha_node(color->a)}));
    }
    return Node::token("stroke", std::move(args));
}

Stroke read_stroke_or_width(const Node& list, double default_width) {
    if (const Node* stroke = find_token(list, "stroke")) {
        return Stroke::from_node(*stroke);
    }
    Stroke s;
    s.width = default_width;
    if (const Node* width = find_token(list, "width")) {
        s.width = safe_get_float(*width, 1, default_width);
    }
    return s;
}

// --- Fill ---

Fill Fill::from_node(const Node& token) {
    Fill f;
    if (has_token(token, "type")) {
        f.type = get_enum(token, "type", fill_types, FillType::NONE);
    } else {
        f.type = parse_enum(get_value(token, 1), fill_types, FillType::NONE);
    }
    return f;
}

Node Fill::to_node() const {
    return Node::token("fill", {Node::token("type", {Node::symbol(fill_type_name(type))})});
}

// --- Property ---

Property Property::from_node(const Node& token) {
    Property p;
    p.key = normalize_text(safe_get_str(token, 1));
    p.value = normalize_text(safe_get_str(token, 2));
    p.id = get_optional_int(token, "id");
    p.position = get_optional_position(token, "at");

    // Only the first (id) and (at) are modelled; repeats stay in `extra`
    const Node* id_token = p.id ? find_token(token, "id") : nullptr;
    const Node* at_token = p.position ? find_token(token, "at") : nullptr;

    for (size_t i = 3; i < token.size(); i++) {
        const Node& child = token[i];
        if (&child == id_token || &child == at_token) continue;
        p.extra.push_back(child);
    }
    return p;
}

Node Property::to_node() const {
    std::vector<Node> args = {Node::quoted(key), Node::quoted(value)};
    if (id) {
        args.push_back(Node::token("id", {Node::integer(*id)}));
    }
    if (position) {
        args.push_back(position->to_node("at"));
    }
    for (const auto& e : extra) {
        args.push_back(e);
    }
    return Node::token("property", std::move(args));
}

} // namespace kisexpr
