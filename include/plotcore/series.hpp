#pragma once

#include <cmath>
#include <functional>
#include <optional>
#include <plotcore/context.hpp>
#include <plotcore/errors.hpp>
#include <plotcore/logger.hpp>
#include <plotcore/plot_style.hpp>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace plotcore
{

namespace detail
{

template <typename X, typename Y>
std::optional<AxesBounds<X, Y>> points_bounds(std::span<const Point2<X, Y>> points)
{
    std::vector<X> xs;
    std::vector<Y> ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points)
    {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }
    auto xr = AxisRange<X>::fit(xs);
    auto yr = AxisRange<Y>::fit(ys);
    if (!xr || !yr)
        return std::nullopt;
    return AxesBounds<X, Y>(*xr, *yr);
}

template <typename T>
bool is_finite_value(T v)
{
    if constexpr (std::is_floating_point_v<T>)
        return std::isfinite(v);
    else
        return true;
}

}   // namespace detail

// Shared style plumbing for series types. Setters called on an lvalue return
// a modified copy and leave the original untouched; on an rvalue they move,
// so Line<>().color(c).width(2) builds in place.
template <typename Derived, typename X, typename Y>
class StyledGeometry : public GeometryAxes<X, Y>
{
   public:
    Derived color(const Color& c) const&
    {
        Derived d(self());
        return std::move(d).color(c);
    }
    Derived color(const Color& c) &&
    {
        style_.color = c;
        return std::move(self());
    }

    Derived width(float w) const&
    {
        Derived d(self());
        return std::move(d).width(w);
    }
    Derived width(float w) &&
    {
        style_.line_width = w;
        return std::move(self());
    }

    Derived line_style(LineStyle s) const&
    {
        Derived d(self());
        return std::move(d).line_style(s);
    }
    Derived line_style(LineStyle s) &&
    {
        style_.line_style = s;
        return std::move(self());
    }

    Derived marker(MarkerStyle m, float size) const&
    {
        Derived d(self());
        return std::move(d).marker(m, size);
    }
    Derived marker(MarkerStyle m, float size) &&
    {
        style_.marker_style = m;
        style_.marker_size  = size;
        return std::move(self());
    }

    Derived opacity(float o) const&
    {
        Derived d(self());
        return std::move(d).opacity(o);
    }
    Derived opacity(float o) &&
    {
        style_.opacity = o;
        return std::move(self());
    }

    Derived label(std::string text) const&
    {
        Derived d(self());
        return std::move(d).label(std::move(text));
    }
    Derived label(std::string text) &&
    {
        label_ = std::move(text);
        return std::move(self());
    }

    // Applies a format string such as "r--o". Width and sizes are kept.
    Derived format(std::string_view fmt) const&
    {
        Derived d(self());
        return std::move(d).format(fmt);
    }
    Derived format(std::string_view fmt) &&
    {
        PlotStyle ps        = parse_format_string(fmt);
        style_.line_style   = ps.line_style;
        style_.marker_style = ps.marker_style;
        if (ps.color.has_value())
            style_.color = ps.color;
        return std::move(self());
    }

    const PlotStyle&   style() const { return style_; }
    const std::string& label() const { return label_; }

    DrawStyle resolved_style() const { return resolve_style(style_, palette::default_cycle[0]); }

    // Called on attach; leaves an explicitly set color alone.
    void assign_default_color(const Color& c)
    {
        if (!style_.color.has_value())
            style_.color = c;
    }

   protected:
    StyledGeometry() = default;
    explicit StyledGeometry(const PlotStyle& style) : style_(style) {}

    PlotStyle   style_;
    std::string label_;

   private:
    Derived&       self() { return static_cast<Derived&>(*this); }
    const Derived& self() const { return static_cast<const Derived&>(*this); }
};

// Polyline through the points in insertion order. No smoothing, no
// de-duplication: n points give n - 1 segments, fewer than two give none.
template <typename X = double, typename Y = double>
class Line final : public StyledGeometry<Line<X, Y>, X, Y>
{
   public:
    Line() = default;

    Line& add_point(const Point2<X, Y>& p)
    {
        points_.push_back(p);
        return *this;
    }

    Line& add_points(std::span<const Point2<X, Y>> points)
    {
        points_.insert(points_.end(), points.begin(), points.end());
        return *this;
    }

    void clear() { points_.clear(); }

    std::span<const Point2<X, Y>> points() const { return points_; }
    size_t                        point_count() const { return points_.size(); }

    std::optional<AxesBounds<X, Y>> data_bounds() const
    {
        return detail::points_bounds<X, Y>(points_);
    }

    void render_axes(AxesContext<X, Y>& cx) override
    {
        const DrawStyle style = this->resolved_style();
        if (this->style_.has_line())
            cx.draw_polyline(points_, style);
        if (this->style_.has_marker())
        {
            for (const auto& p : points_)
                cx.draw_marker(cx.data_to_screen(p), style);
        }
        PLOTCORE_LOG_TRACE("render", "Line rendered {} points", points_.size());
    }

   private:
    std::vector<Point2<X, Y>> points_;
};

// Scatter series: one marker per point, no connecting line.
template <typename X = double, typename Y = double>
class Points final : public StyledGeometry<Points<X, Y>, X, Y>
{
   public:
    Points()
        : StyledGeometry<Points<X, Y>, X, Y>(
              PlotStyle{.line_style = LineStyle::None, .marker_style = MarkerStyle::Circle})
    {
    }

    Points& add_point(const Point2<X, Y>& p)
    {
        points_.push_back(p);
        return *this;
    }

    void clear() { points_.clear(); }

    std::span<const Point2<X, Y>> points() const { return points_; }
    size_t                        point_count() const { return points_.size(); }

    std::optional<AxesBounds<X, Y>> data_bounds() const
    {
        return detail::points_bounds<X, Y>(points_);
    }

    void render_axes(AxesContext<X, Y>& cx) override
    {
        DrawStyle style = this->resolved_style();
        if (style.marker_style == MarkerStyle::None)
            style.marker_style = MarkerStyle::Point;
        for (const auto& p : points_)
            cx.draw_marker(cx.data_to_screen(p), style);
    }

   private:
    std::vector<Point2<X, Y>> points_;
};

// Samples y = f(x) lazily at render time across whatever x range the axes
// currently shows. Non-finite samples break the curve rather than join it.
template <typename X = double, typename Y = double>
class FunctionCurve final : public StyledGeometry<FunctionCurve<X, Y>, X, Y>
{
   public:
    using Function = std::function<Y(X)>;

    explicit FunctionCurve(Function fn, size_t samples = 256) : fn_(std::move(fn)), samples_(samples)
    {
        if (!fn_)
            throw ConstructionError("FunctionCurve requires a callable");
        if (samples_ < 2)
            throw ConstructionError("FunctionCurve needs at least 2 samples, got "
                                    + std::to_string(samples_));
    }

    size_t samples() const { return samples_; }

    void render_axes(AxesContext<X, Y>& cx) override
    {
        const DrawStyle style = this->resolved_style();
        if (!this->style_.has_line())
            return;

        const auto&  xr   = cx.bounds().x();
        const double lo   = static_cast<double>(xr.min());
        const double span = static_cast<double>(xr.max()) - lo;

        std::optional<Vec2> prev;
        size_t              drawn = 0;
        for (size_t i = 0; i < samples_; ++i)
        {
            double t = static_cast<double>(i) / static_cast<double>(samples_ - 1);
            X      x = (i + 1 == samples_) ? xr.max() : static_cast<X>(lo + span * t);
            Y      y = fn_(x);
            if (!detail::is_finite_value(y))
            {
                prev.reset();
                continue;
            }
            Vec2 next = cx.data_to_screen(Point2<X, Y>{x, y});
            if (prev)
            {
                cx.draw_segment(*prev, next, style);
                ++drawn;
            }
            prev = next;
        }
        PLOTCORE_LOG_TRACE("render", "FunctionCurve emitted {} segments", drawn);
    }

   private:
    Function fn_;
    size_t   samples_;
};

}   // namespace plotcore
