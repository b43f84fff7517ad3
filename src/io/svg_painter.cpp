#include <cstdio>
#include <plotcore/export.hpp>
#include <plotcore/logger.hpp>

namespace plotcore
{

namespace
{

std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "rgb(%d,%d,%d)",
                  static_cast<int>(c.r * 255.0f + 0.5f),
                  static_cast<int>(c.g * 255.0f + 0.5f),
                  static_cast<int>(c.b * 255.0f + 0.5f));
    return buf;
}

std::string fmt(float v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", static_cast<double>(v));
    return buf;
}

std::string xml_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

void emit_stroke(std::ostream& svg, const DrawStyle& style)
{
    svg << " stroke=\"" << svg_color(style.color) << "\" stroke-width=\"" << fmt(style.line_width)
        << "\"";
    if (style.color.a < 1.0f)
        svg << " stroke-opacity=\"" << fmt(style.color.a) << "\"";

    DashPattern dash = dash_pattern(style.line_style, style.line_width);
    if (dash.count > 0)
    {
        svg << " stroke-dasharray=\"";
        for (int i = 0; i < dash.count; ++i)
            svg << (i ? "," : "") << fmt(dash.segments[i]);
        svg << "\"";
    }
}

void emit_marker(std::ostream& svg, const Drawable& d)
{
    const float r    = d.style.marker_size * 0.5f;
    const float x    = d.p0.x;
    const float y    = d.p0.y;
    const auto  fill = svg_color(d.style.color);

    switch (d.style.marker_style)
    {
        case MarkerStyle::Square:
            svg << "      <rect x=\"" << fmt(x - r) << "\" y=\"" << fmt(y - r) << "\" width=\""
                << fmt(2.0f * r) << "\" height=\"" << fmt(2.0f * r) << "\" fill=\"" << fill
                << "\"/>\n";
            break;
        case MarkerStyle::Diamond:
            svg << "      <path d=\"M" << fmt(x) << "," << fmt(y - r) << " L" << fmt(x + r) << ","
                << fmt(y) << " L" << fmt(x) << "," << fmt(y + r) << " L" << fmt(x - r) << ","
                << fmt(y) << " Z\" fill=\"" << fill << "\"/>\n";
            break;
        case MarkerStyle::TriangleUp:
            svg << "      <path d=\"M" << fmt(x) << "," << fmt(y - r) << " L" << fmt(x + r) << ","
                << fmt(y + r) << " L" << fmt(x - r) << "," << fmt(y + r) << " Z\" fill=\"" << fill
                << "\"/>\n";
            break;
        case MarkerStyle::Plus:
            svg << "      <path d=\"M" << fmt(x - r) << "," << fmt(y) << " H" << fmt(x + r) << " M"
                << fmt(x) << "," << fmt(y - r) << " V" << fmt(y + r) << "\" stroke=\"" << fill
                << "\"/>\n";
            break;
        case MarkerStyle::Cross:
            svg << "      <path d=\"M" << fmt(x - r) << "," << fmt(y - r) << " L" << fmt(x + r)
                << "," << fmt(y + r) << " M" << fmt(x - r) << "," << fmt(y + r) << " L"
                << fmt(x + r) << "," << fmt(y - r) << "\" stroke=\"" << fill << "\"/>\n";
            break;
        case MarkerStyle::Point:
            svg << "      <circle cx=\"" << fmt(x) << "\" cy=\"" << fmt(y) << "\" r=\""
                << fmt(r * 0.5f) << "\" fill=\"" << fill << "\"/>\n";
            break;
        case MarkerStyle::None:
        case MarkerStyle::Circle:
            svg << "      <circle cx=\"" << fmt(x) << "\" cy=\"" << fmt(y) << "\" r=\"" << fmt(r)
                << "\" fill=\"" << fill << "\"/>\n";
            break;
    }
}

}   // namespace

void SvgPainter::begin_frame(const FigureFrame& frame)
{
    out_.str({});
    out_.clear();
    clip_id_ = 0;

    out_ << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
         << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << fmt(frame.width)
         << "\" height=\"" << fmt(frame.height) << "\" viewBox=\"0 0 " << fmt(frame.width) << " "
         << fmt(frame.height) << "\">\n";
    if (!frame.title.empty())
        out_ << "  <title>" << xml_escape(frame.title) << "</title>\n";
    out_ << "  <rect width=\"100%\" height=\"100%\" fill=\"" << svg_color(frame.background)
         << "\"/>\n";
}

void SvgPainter::paint_axes(const PlotFrame& plot, const AxesFrame& axes)
{
    const Rect& vp = axes.viewport;
    const auto  id = clip_id_++;

    out_ << "  <clipPath id=\"clip" << id << "\"><rect x=\"" << fmt(vp.x) << "\" y=\""
         << fmt(vp.y) << "\" width=\"" << fmt(vp.w) << "\" height=\"" << fmt(vp.h)
         << "\"/></clipPath>\n";
    out_ << "  <g class=\"axes\"";
    if (!plot.name.empty())
        out_ << " data-plot=\"" << xml_escape(plot.name) << "\"";
    out_ << " clip-path=\"url(#clip" << id << ")\">\n";

    for (const auto& d : axes.drawables)
    {
        if (d.kind == Drawable::Kind::Marker)
        {
            emit_marker(out_, d);
            continue;
        }
        out_ << "      <line x1=\"" << fmt(d.p0.x) << "\" y1=\"" << fmt(d.p0.y) << "\" x2=\""
             << fmt(d.p1.x) << "\" y2=\"" << fmt(d.p1.y) << "\"";
        emit_stroke(out_, d.style);
        out_ << "/>\n";
    }

    out_ << "  </g>\n";
}

void SvgPainter::end_frame()
{
    out_ << "</svg>\n";
    PLOTCORE_LOG_TRACE("render", "SVG frame written ({} axes)", clip_id_);
}

std::string render_svg(const FigureFrame& frame)
{
    SvgPainter painter;
    paint_frame(frame, painter);
    return painter.svg();
}

}   // namespace plotcore
