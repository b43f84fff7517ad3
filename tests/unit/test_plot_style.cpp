#include <gtest/gtest.h>
#include <plotcore/plot_style.hpp>

using namespace plotcore;

// ═══════════════════════════════════════════════════════════════════════════════
// Names
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LineStyleTest, Names)
{
    EXPECT_STREQ(line_style_name(LineStyle::None), "None");
    EXPECT_STREQ(line_style_name(LineStyle::Solid), "Solid");
    EXPECT_STREQ(line_style_name(LineStyle::Dashed), "Dashed");
    EXPECT_STREQ(line_style_name(LineStyle::Dotted), "Dotted");
    EXPECT_STREQ(line_style_name(LineStyle::DashDot), "Dash-Dot");
}

TEST(MarkerStyleTest, Names)
{
    EXPECT_STREQ(marker_style_name(MarkerStyle::None), "None");
    EXPECT_STREQ(marker_style_name(MarkerStyle::Circle), "Circle");
    EXPECT_STREQ(marker_style_name(MarkerStyle::TriangleUp), "Triangle Up");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Dash patterns
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DashPatternTest, SolidHasNoDashes)
{
    EXPECT_EQ(dash_pattern(LineStyle::Solid, 2.0f).count, 0);
    EXPECT_EQ(dash_pattern(LineStyle::None, 2.0f).count, 0);
}

TEST(DashPatternTest, ScalesWithWidth)
{
    auto thin  = dash_pattern(LineStyle::Dashed, 1.0f);
    auto thick = dash_pattern(LineStyle::Dashed, 2.0f);
    ASSERT_EQ(thin.count, 2);
    EXPECT_FLOAT_EQ(thick.segments[0], 2.0f * thin.segments[0]);
    EXPECT_FLOAT_EQ(thick.segments[1], 2.0f * thin.segments[1]);
}

TEST(DashPatternTest, DashDotHasFourSegments)
{
    EXPECT_EQ(dash_pattern(LineStyle::DashDot, 1.0f).count, 4);
    EXPECT_EQ(dash_pattern(LineStyle::Dotted, 1.0f).count, 2);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Format string parser
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FormatParser, ColorDashedCircle)
{
    auto s = parse_format_string("r--o");
    ASSERT_TRUE(s.color.has_value());
    EXPECT_EQ(*s.color, colors::red);
    EXPECT_EQ(s.line_style, LineStyle::Dashed);
    EXPECT_EQ(s.marker_style, MarkerStyle::Circle);
}

TEST(FormatParser, MarkerOnlyHasNoLine)
{
    auto s = parse_format_string("bo");
    EXPECT_EQ(*s.color, colors::blue);
    EXPECT_EQ(s.line_style, LineStyle::None);
    EXPECT_EQ(s.marker_style, MarkerStyle::Circle);
    EXPECT_FALSE(s.has_line());
    EXPECT_TRUE(s.has_marker());
}

TEST(FormatParser, ColorOnlyIsSolid)
{
    auto s = parse_format_string("k");
    EXPECT_EQ(*s.color, colors::black);
    EXPECT_EQ(s.line_style, LineStyle::Solid);
    EXPECT_EQ(s.marker_style, MarkerStyle::None);
}

TEST(FormatParser, EmptyIsSolidWithoutColor)
{
    auto s = parse_format_string("");
    EXPECT_FALSE(s.color.has_value());
    EXPECT_EQ(s.line_style, LineStyle::Solid);
}

TEST(FormatParser, AllLineStyles)
{
    EXPECT_EQ(parse_format_string("-").line_style, LineStyle::Solid);
    EXPECT_EQ(parse_format_string("--").line_style, LineStyle::Dashed);
    EXPECT_EQ(parse_format_string(":").line_style, LineStyle::Dotted);
    EXPECT_EQ(parse_format_string("-.").line_style, LineStyle::DashDot);
}

TEST(FormatParser, AllMarkers)
{
    EXPECT_EQ(parse_format_string(".").marker_style, MarkerStyle::Point);
    EXPECT_EQ(parse_format_string("+").marker_style, MarkerStyle::Plus);
    EXPECT_EQ(parse_format_string("x").marker_style, MarkerStyle::Cross);
    EXPECT_EQ(parse_format_string("s").marker_style, MarkerStyle::Square);
    EXPECT_EQ(parse_format_string("d").marker_style, MarkerStyle::Diamond);
    EXPECT_EQ(parse_format_string("^").marker_style, MarkerStyle::TriangleUp);
}

TEST(FormatParser, OrderDoesNotMatter)
{
    auto a = parse_format_string("o:g");
    EXPECT_EQ(*a.color, colors::green);
    EXPECT_EQ(a.line_style, LineStyle::Dotted);
    EXPECT_EQ(a.marker_style, MarkerStyle::Circle);
}

TEST(FormatParser, UnknownCharactersIgnored)
{
    auto s = parse_format_string("zq-");
    EXPECT_FALSE(s.color.has_value());
    EXPECT_EQ(s.line_style, LineStyle::Solid);
}

// ═══════════════════════════════════════════════════════════════════════════════
// resolve_style
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ResolveStyle, FallbackColorWhenUnset)
{
    PlotStyle ps;
    auto      d = resolve_style(ps, colors::magenta);
    EXPECT_EQ(d.color, colors::magenta);
    EXPECT_FLOAT_EQ(d.line_width, ps.line_width);
}

TEST(ResolveStyle, OpacityMultipliesAlpha)
{
    PlotStyle ps;
    ps.color   = colors::red.with_alpha(0.8f);
    ps.opacity = 0.5f;
    auto d     = resolve_style(ps, colors::black);
    EXPECT_FLOAT_EQ(d.color.a, 0.4f);
    EXPECT_FLOAT_EQ(d.color.r, 1.0f);
}

TEST(PaletteTest, CycleWraps)
{
    EXPECT_EQ(palette::cycle(0), palette::default_cycle[0]);
    EXPECT_EQ(palette::cycle(palette::default_cycle_size), palette::default_cycle[0]);
    EXPECT_EQ(palette::cycle(palette::default_cycle_size + 2), palette::default_cycle[2]);
}

TEST(ColorTest, Factories)
{
    EXPECT_EQ(rgb(0.1f, 0.2f, 0.3f), (Color{0.1f, 0.2f, 0.3f, 1.0f}));
    EXPECT_EQ(rgba(0.1f, 0.2f, 0.3f, 0.4f), rgb(0.1f, 0.2f, 0.3f).with_alpha(0.4f));
}
