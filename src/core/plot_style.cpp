#include <plotcore/plot_style.hpp>

namespace plotcore
{

DashPattern dash_pattern(LineStyle style, float line_width)
{
    DashPattern p;
    const float w = line_width;
    switch (style)
    {
        case LineStyle::None:
        case LineStyle::Solid:
            break;
        case LineStyle::Dashed:
            p.segments[0] = 6.0f * w;
            p.segments[1] = 3.0f * w;
            p.count       = 2;
            break;
        case LineStyle::Dotted:
            p.segments[0] = 1.0f * w;
            p.segments[1] = 2.0f * w;
            p.count       = 2;
            break;
        case LineStyle::DashDot:
            p.segments[0] = 6.0f * w;
            p.segments[1] = 2.5f * w;
            p.segments[2] = 1.0f * w;
            p.segments[3] = 2.5f * w;
            p.count       = 4;
            break;
    }
    return p;
}

namespace
{

std::optional<Color> color_for(char c)
{
    switch (c)
    {
        case 'r':
            return colors::red;
        case 'g':
            return colors::green;
        case 'b':
            return colors::blue;
        case 'c':
            return colors::cyan;
        case 'm':
            return colors::magenta;
        case 'y':
            return colors::yellow;
        case 'k':
            return colors::black;
        case 'w':
            return colors::white;
        default:
            return std::nullopt;
    }
}

std::optional<MarkerStyle> marker_for(char c)
{
    switch (c)
    {
        case '.':
            return MarkerStyle::Point;
        case 'o':
            return MarkerStyle::Circle;
        case '+':
            return MarkerStyle::Plus;
        case 'x':
            return MarkerStyle::Cross;
        case 's':
            return MarkerStyle::Square;
        case 'd':
            return MarkerStyle::Diamond;
        case '^':
            return MarkerStyle::TriangleUp;
        default:
            return std::nullopt;
    }
}

}   // namespace

PlotStyle parse_format_string(std::string_view fmt)
{
    PlotStyle style;
    style.line_style = LineStyle::None;
    bool has_line    = false;
    bool has_marker  = false;

    size_t i = 0;
    while (i < fmt.size())
    {
        char c = fmt[i];

        if (c == '-')
        {
            has_line = true;
            if (i + 1 < fmt.size() && fmt[i + 1] == '-')
            {
                style.line_style = LineStyle::Dashed;
                i += 2;
            }
            else if (i + 1 < fmt.size() && fmt[i + 1] == '.')
            {
                style.line_style = LineStyle::DashDot;
                i += 2;
            }
            else
            {
                style.line_style = LineStyle::Solid;
                i += 1;
            }
            continue;
        }
        if (c == ':')
        {
            has_line         = true;
            style.line_style = LineStyle::Dotted;
            ++i;
            continue;
        }
        if (auto col = color_for(c))
        {
            style.color = *col;
        }
        else if (auto m = marker_for(c))
        {
            style.marker_style = *m;
            has_marker         = true;
        }
        ++i;
    }

    // A bare color ("r") or an empty string still draws a solid line
    if (!has_line && !has_marker)
        style.line_style = LineStyle::Solid;

    return style;
}

}   // namespace plotcore
