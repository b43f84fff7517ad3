#pragma once

#include <cstdint>
#include <optional>
#include <plotcore/color.hpp>
#include <string_view>

namespace plotcore
{

enum class LineStyle : uint8_t
{
    None,      // markers only
    Solid,     // '-'
    Dashed,    // '--'
    Dotted,    // ':'
    DashDot,   // '-.'
};

enum class MarkerStyle : uint8_t
{
    None,
    Point,        // '.'
    Circle,       // 'o'
    Plus,         // '+'
    Cross,        // 'x'
    Square,       // 's'
    Diamond,      // 'd'
    TriangleUp,   // '^'
};

// Style as configured on a series. Unset color means "use the default".
struct PlotStyle
{
    LineStyle            line_style   = LineStyle::Solid;
    MarkerStyle          marker_style = MarkerStyle::None;
    std::optional<Color> color;
    float                line_width  = 1.5f;
    float                marker_size = 5.0f;
    float                opacity     = 1.0f;

    bool has_line() const { return line_style != LineStyle::None; }
    bool has_marker() const { return marker_style != MarkerStyle::None; }
};

// Fully resolved style attached to each drawable handed to a painter.
struct DrawStyle
{
    Color       color        = palette::default_cycle[0];
    float       line_width   = 1.5f;
    LineStyle   line_style   = LineStyle::Solid;
    MarkerStyle marker_style = MarkerStyle::None;
    float       marker_size  = 5.0f;

    bool operator==(const DrawStyle&) const = default;
};

inline DrawStyle resolve_style(const PlotStyle& style, const Color& fallback)
{
    DrawStyle out;
    out.color        = style.color.value_or(fallback);
    out.color.a *= style.opacity;
    out.line_width   = style.line_width;
    out.line_style   = style.line_style;
    out.marker_style = style.marker_style;
    out.marker_size  = style.marker_size;
    return out;
}

constexpr const char* line_style_name(LineStyle s)
{
    switch (s)
    {
        case LineStyle::None:
            return "None";
        case LineStyle::Solid:
            return "Solid";
        case LineStyle::Dashed:
            return "Dashed";
        case LineStyle::Dotted:
            return "Dotted";
        case LineStyle::DashDot:
            return "Dash-Dot";
    }
    return "Unknown";
}

constexpr const char* marker_style_name(MarkerStyle s)
{
    switch (s)
    {
        case MarkerStyle::None:
            return "None";
        case MarkerStyle::Point:
            return "Point";
        case MarkerStyle::Circle:
            return "Circle";
        case MarkerStyle::Plus:
            return "Plus";
        case MarkerStyle::Cross:
            return "Cross";
        case MarkerStyle::Square:
            return "Square";
        case MarkerStyle::Diamond:
            return "Diamond";
        case MarkerStyle::TriangleUp:
            return "Triangle Up";
    }
    return "Unknown";
}

// On/off lengths in logical units, scaled by line width. count == 0 means solid.
struct DashPattern
{
    float segments[4]{};
    int   count = 0;
};

DashPattern dash_pattern(LineStyle style, float line_width);

// MATLAB-style format strings: [color][line][marker] in any order.
//   color:  r g b c m y k w
//   line:   -  --  :  -.
//   marker: .  o  +  x  s  d  ^
// "r--o" is a red dashed line with circles; "bo" is blue circles, no line.
// Unknown characters are ignored.
PlotStyle parse_format_string(std::string_view fmt);

}   // namespace plotcore
