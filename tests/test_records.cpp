#include <gtest/gtest.h>

#include "fields.h"
#include "geometry.h"
#include "parser.h"
#include "records.h"
#include "serializer.h"

#include <string>

using namespace kisexpr;

// --- Geometry ---

TEST(Geometry, PointFromXy) {
    Point p = Point::from_node(parse("(xy 1.5 -2)"));
    EXPECT_EQ(p, Point(1.5, -2));
    EXPECT_EQ(p.to_node(), parse("(xy 1.5 -2.0)"));
}

TEST(Geometry, PositionWithAngle) {
    Position p = Position::from_node(parse("(at 10 20 90)"));
    EXPECT_EQ(p, Position(10, 20, 90));
    EXPECT_FALSE(p.z.has_value());
    EXPECT_EQ(render(p.to_node()), "(at 10.0 20.0 90.0)");
}

TEST(Geometry, PositionAngleOmittedWhenZero) {
    Position p = Position::from_node(parse("(at 1.27 2.54)"));
    EXPECT_DOUBLE_EQ(p.angle, 0.0);
    EXPECT_EQ(render(p.to_node()), "(at 1.27 2.54)");
    EXPECT_EQ(render(p.to_node("start")), "(start 1.27 2.54)");
}

TEST(Geometry, PositionXyz) {
    Node offset = parse("(offset (xyz 0 0.5 -1))");
    Position p = Position::from_node(offset);
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 0.5);
    ASSERT_TRUE(p.z.has_value());
    EXPECT_DOUBLE_EQ(*p.z, -1.0);
    EXPECT_EQ(render(p.to_node("offset")), "(offset\n\t(xyz 0.0 0.5 -1.0)\n)");

    Node model = parse("(model \"R.wrl\" (offset (xyz 1 2 3)))");
    auto opt = get_optional_position(model, "offset");
    ASSERT_TRUE(opt.has_value());
    EXPECT_EQ(opt->z, 3.0);
}

TEST(Geometry, PositionEqualityToleratesRounding) {
    Position a(1, 2);
    a.z = 0.1 + 0.2;
    Position b(1, 2);
    b.z = 0.3;
    EXPECT_EQ(a, b);

    b.z = 0.31;
    EXPECT_NE(a, b);
    b.z.reset();
    EXPECT_NE(a, b);
}

TEST(Geometry, ShortPositionReadsZeros) {
    EXPECT_EQ(Position::from_node(parse("(at)")), Position());
    EXPECT_EQ(Position::from_node(Node::symbol("at")), Position());
}

// --- Stroke ---

TEST(Stroke, FullForm) {
    Node n = parse("(stroke (width 0.1524) (type dash_dot) (color 255 0 0 0.5))");
    Stroke s = Stroke::from_node(n);
    EXPECT_DOUBLE_EQ(s.width, 0.1524);
    ASSERT_TRUE(s.type.has_value());
    EXPECT_EQ(*s.type, StrokeType::DASH_DOT);
    ASSERT_TRUE(s.color.has_value());
    EXPECT_EQ(s.color->r, 255);
    EXPECT_EQ(s.color->g, 0);
    EXPECT_DOUBLE_EQ(s.color->a, 0.5);

    EXPECT_EQ(render(s.to_node()),
              "(stroke\n"
              "\t(width 0.1524)\n"
              "\t(type dash_dot)\n"
              "\t(color 255 0 0 0.5)\n"
              ")");
}

TEST(Stroke, WholeAlphaWrittenAsInteger) {
    Node n = parse("(stroke (width 0) (type default) (color 0 0 0 0))");
    Stroke s = Stroke::from_node(n);
    Node back = s.to_node();
    EXPECT_EQ(back, parse("(stroke (width 0.0) (type default) (color 0 0 0 0))"));
}

TEST(Stroke, OptionalPartsStayAbsent) {
    Stroke s = Stroke::from_node(parse("(stroke (width 0.2))"));
    EXPECT_FALSE(s.type.has_value());
    EXPECT_FALSE(s.color.has_value());
    EXPECT_EQ(s.effective_type(), StrokeType::SOLID);
    EXPECT_EQ(s.to_node(), parse("(stroke (width 0.2))"));
}

TEST(Stroke, UnknownTypeReadsSolid) {
    Stroke s = Stroke::from_node(parse("(stroke (width 0.2) (type wavy))"));
    ASSERT_TRUE(s.type.has_value());
    EXPECT_EQ(*s.type, StrokeType::SOLID);
}

TEST(Stroke, MissingWidthUsesDefault) {
    Stroke s = Stroke::from_node(parse("(stroke (type dot))"));
    EXPECT_DOUBLE_EQ(s.width, 0.254);
    EXPECT_EQ(s.effective_type(), StrokeType::DOT);
}

TEST(Stroke, LegacyBareWidth) {
    Node line = parse("(fp_line (start 0 0) (end 1 0) (width 0.12) (layer \"F.SilkS\"))");
    Stroke s = read_stroke_or_width(line);
    EXPECT_DOUBLE_EQ(s.width, 0.12);
    EXPECT_FALSE(s.type.has_value());
}

TEST(Stroke, StructuredFormWinsOverBareWidth) {
    Node line = parse("(fp_line (width 0.3) (stroke (width 0.12) (type solid)))");
    Stroke s = read_stroke_or_width(line);
    EXPECT_DOUBLE_EQ(s.width, 0.12);
    EXPECT_EQ(s.effective_type(), StrokeType::SOLID);
}

TEST(Stroke, NeitherFormGivesDefault) {
    Stroke s = read_stroke_or_width(parse("(fp_line (start 0 0))"), 0.15);
    EXPECT_DOUBLE_EQ(s.width, 0.15);
}

TEST(Stroke, TypeNames) {
    EXPECT_EQ(stroke_type_name(StrokeType::DASH_DOT_DOT), "dash_dot_dot");
    EXPECT_EQ(stroke_type_name(StrokeType::DEFAULT), "default");
    EXPECT_EQ(fill_type_name(FillType::BACKGROUND), "background");
}

// --- Fill ---

TEST(Fill, TypedForm) {
    EXPECT_EQ(Fill::from_node(parse("(fill (type background))")).type, FillType::BACKGROUND);
    EXPECT_EQ(Fill::from_node(parse("(fill (type outline))")).type, FillType::OUTLINE);
}

TEST(Fill, LegacyForm) {
    EXPECT_EQ(Fill::from_node(parse("(fill none)")).type, FillType::NONE);
    EXPECT_EQ(Fill::from_node(parse("(fill color)")).type, FillType::COLOR);
}

TEST(Fill, UnknownOrEmptyIsNone) {
    EXPECT_EQ(Fill::from_node(parse("(fill (type hatch))")).type, FillType::NONE);
    EXPECT_EQ(Fill::from_node(parse("(fill)")).type, FillType::NONE);
}

TEST(Fill, WritesTypedForm) {
    Fill f;
    f.type = FillType::OUTLINE;
    EXPECT_EQ(render(f.to_node()), "(fill\n\t(type outline)\n)");
    EXPECT_EQ(Fill::from_node(parse("(fill none)")).to_node(), parse("(fill (type none))"));
}

// --- Property ---

TEST(Property, ModelledFieldsAndExtras) {
    Node n = parse(
        "(property \"Reference\" \"R1\" (id 0) (at 2.032 0 90)"
        " (effects (font (size 1.27 1.27)) hide))");
    Property p = Property::from_node(n);
    EXPECT_EQ(p.key, "Reference");
    EXPECT_EQ(p.value, "R1");
    EXPECT_EQ(p.id, 0);
    ASSERT_TRUE(p.position.has_value());
    EXPECT_EQ(*p.position, Position(2.032, 0, 90));
    ASSERT_EQ(p.extra.size(), 1u);
    EXPECT_TRUE(p.extra[0].is_token("effects"));

    Node back = p.to_node();
    ASSERT_EQ(back.size(), 6u);
    EXPECT_EQ(back[3], parse("(id 0)"));
    EXPECT_EQ(back[5], n[5]);
}

TEST(Property, NewerFileWithoutId) {
    Node n = parse("(property \"Value\" \"10k\" (at 0 0 0) (show_name) (do_not_autoplace))");
    Property p = Property::from_node(n);
    EXPECT_FALSE(p.id.has_value());
    ASSERT_EQ(p.extra.size(), 2u);
    EXPECT_TRUE(p.extra[0].is_token("show_name"));
    EXPECT_TRUE(p.extra[1].is_token("do_not_autoplace"));
    EXPECT_EQ(Property::from_node(p.to_node()).extra, p.extra);
}

TEST(Property, UnreadableIdIsKeptAsExtra) {
    Property p = Property::from_node(parse("(property \"K\" \"V\" (id abc))"));
    EXPECT_FALSE(p.id.has_value());
    ASSERT_EQ(p.extra.size(), 1u);
    EXPECT_EQ(p.extra[0], parse("(id abc)"));
}

TEST(Property, RepeatedAtAndIdAreKept) {
    Node n = parse("(property \"K\" \"V\" (at 1 2) (effects) (at 3 4) (id 5) (id 6))");
    Property p = Property::from_node(n);
    ASSERT_TRUE(p.position.has_value());
    EXPECT_EQ(*p.position, Position(1, 2));
    EXPECT_EQ(p.id, 5);
    ASSERT_EQ(p.extra.size(), 3u);
    EXPECT_TRUE(p.extra[0].is_token("effects"));
    EXPECT_EQ(p.extra[1], parse("(at 3 4)"));
    EXPECT_EQ(p.extra[2], parse("(id 6)"));

    Node back = p.to_node();
    ASSERT_EQ(back.size(), 8u);
    EXPECT_EQ(back[6], parse("(at 3 4)"));
    EXPECT_EQ(back[7], parse("(id 6)"));
}

TEST(Property, OldTextNormalized) {
    Property p = Property::from_node(parse("(property \"Value\" \"~\")"));
    EXPECT_EQ(p.value, "");
    p = Property::from_node(parse("(property \"Pin\" \"~RST~\")"));
    EXPECT_EQ(p.value, "~{RST}");
}
