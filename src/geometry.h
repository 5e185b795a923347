#pragma once

#include "node.h"

#include <cmath>
#include <optional>
#include <string>

namespace kisexpr {

// (xy X Y)
struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x, double y) : x(x), y(y) {}

    bool operator==(const Point& o) const {
        return std::abs(x - o.x) < 1e-6 && std::abs(y - o.y) < 1e-6;
    }
    bool operator!=(const Point& o) const { return !(*this == o); }

    static Point from_node(const Node& token);
    Node to_node() const;
};

// (at X Y [ANGLE]) or, when z is set, (TOKEN (xyz X Y Z)) as used by 3D
// model offsets.
struct Position {
    double x = 0.0;
    double y = 0.0;
    double angle = 0.0;
    std::optional<double> z;

    Position() = default;
    Position(double x, double y, double angle = 0.0) : x(x), y(y), angle(angle) {}

    bool operator==(const Position& o) const {
        return std::abs(x - o.x) < 1e-6 && std::abs(y - o.y) < 1e-6 &&
               std::abs(angle - o.angle) < 1e-6 && same_z(o);
    }
    bool operator!=(const Position& o) const { return !(*this == o); }

    bool same_z(const Position& o) const {
        if (z.has_value() != o.z.has_value()) return false;
        return !z || std::abs(*z - *o.z) < 1e-6;
    }

    static Position from_node(const Node& token);
    // Angle is omitted when zero.
    Node to_node(const std::string& token = "at") const;
};

} // namespace kisexpr
