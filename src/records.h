#pragma once

#include "geometry.h"
#include "node.h"

#include <optional>
#include <string>
#include <vector>

namespace kisexpr {

// Value records shared by every KiCad file family. Each reads itself from
// the named list it is written as and builds that list back.

enum class StrokeType { DASH, DASH_DOT, DASH_DOT_DOT, DOT, DEFAULT, SOLID };

struct Color {
    int r = 0;
    int g = 0;
    int b = 0;
    double a = 0.0;

    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
};

// (stroke (width W) [(type T)] [(color R G B A)])
struct Stroke {
    double width = 0.254;
    std::optional<StrokeType> type;   // written back only if it was present
    std::optional<Color> color;

    // Unknown line styles read as SOLID.
    StrokeType effective_type() const { return type.value_or(StrokeType::SOLID); }

    static Stroke from_node(const Node& token);
    Node to_node() const;
};

// Structured (stroke ...) if present, else the legacy bare (width W), else
// `default_width`. A list carrying both resolves to the structured form.
Stroke read_stroke_or_width(const Node& list, double default_width = 0.254);

enum class FillType { NONE, OUTLINE, BACKGROUND, COLOR };

// (fill (type T)); the older (fill T) form is read as well.
struct Fill {
    FillType type = FillType::NONE;

    static Fill from_node(const Node& token);
    Node to_node() const;
};

// (property "KEY" "VALUE" [(id N)] [(at X Y [A])] ...)
// Children this record does not model (effects, hide, uuid, newer tokens)
// are kept in `extra` and written back after the modelled ones.
struct Property {
    std::string key;
    std::string value;
    std::optional<int64_t> id;
    std::optional<Position> position;
    std::vector<Node> extra;

    static Property from_node(const Node& token);
    Node to_node() const;
};

std::string stroke_type_name(StrokeType type);
std::string fill_type_name(FillType type);

} // namespace kisexpr
