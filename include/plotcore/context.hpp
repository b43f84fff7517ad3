#pragma once

#include <cstdint>
#include <plotcore/axes.hpp>
#include <plotcore/plot_style.hpp>
#include <span>
#include <vector>

namespace plotcore
{

// A screen-space primitive with its style resolved, ready for a painter.
struct Drawable
{
    enum class Kind : uint8_t
    {
        Segment,   // p0 -> p1
        Marker,    // centred on p0
    };

    Kind      kind = Kind::Segment;
    Vec2      p0;
    Vec2      p1;
    DrawStyle style;
};

// Ordered drawables for one axes region. Later entries paint over earlier ones.
class DrawList
{
   public:
    void push_segment(const Vec2& a, const Vec2& b, const DrawStyle& style);
    void push_marker(const Vec2& p, const DrawStyle& style);
    void clear() { items_.clear(); }

    const std::vector<Drawable>& items() const { return items_; }
    size_t                       size() const { return items_.size(); }
    bool                         empty() const { return items_.empty(); }
    size_t                       segment_count() const;
    size_t                       marker_count() const;

    auto begin() const { return items_.begin(); }
    auto end() const { return items_.end(); }

   private:
    std::vector<Drawable> items_;
};

// Scoped per (axes, render pass). Holds a copy of the axes state, so
// geometry can read the transform but has no path back to the model.
// Drawables accumulate here until take_drawables() moves them out.
template <typename X, typename Y>
class AxesContext
{
   public:
    AxesContext(const AxesSnapshot<X, Y>& snapshot, const Rect& viewport)
        : snapshot_(snapshot), viewport_(viewport)
    {
    }

    AxesContext(const AxesContext&)            = delete;
    AxesContext& operator=(const AxesContext&) = delete;

    Vec2 data_to_screen(const Point2<X, Y>& p) const { return snapshot_.transform(p, viewport_); }

    const AxesBounds<X, Y>& bounds() const { return snapshot_.bounds; }
    const GridModel&        grid() const { return snapshot_.grid; }
    const AxisStyle&        axis_style() const { return snapshot_.style; }
    const Rect&             viewport() const { return viewport_; }

    void draw_segment(const Vec2& a, const Vec2& b, const DrawStyle& style)
    {
        drawables_.push_segment(a, b, style);
    }

    void draw_marker(const Vec2& p, const DrawStyle& style) { drawables_.push_marker(p, style); }

    // Connected polyline through `points` in order: size() - 1 segments.
    void draw_polyline(std::span<const Point2<X, Y>> points, const DrawStyle& style)
    {
        if (points.size() < 2)
            return;
        Vec2 prev = data_to_screen(points[0]);
        for (size_t i = 1; i < points.size(); ++i)
        {
            Vec2 next = data_to_screen(points[i]);
            drawables_.push_segment(prev, next, style);
            prev = next;
        }
    }

    const DrawList& drawables() const { return drawables_; }
    DrawList        take_drawables() { return std::move(drawables_); }

   private:
    AxesSnapshot<X, Y> snapshot_;
    Rect               viewport_;
    DrawList           drawables_;
};

// Anything that can draw itself into an axes region. render_axes() is called
// once per render pass for each attached element and may only read the
// context's transform and push drawables into it.
template <typename X, typename Y>
class GeometryAxes
{
   public:
    using x_type = X;
    using y_type = Y;

    virtual ~GeometryAxes() = default;

    virtual void render_axes(AxesContext<X, Y>& cx) = 0;

   protected:
    GeometryAxes()                               = default;
    GeometryAxes(const GeometryAxes&)            = default;
    GeometryAxes(GeometryAxes&&)                 = default;
    GeometryAxes& operator=(const GeometryAxes&) = default;
    GeometryAxes& operator=(GeometryAxes&&)      = default;
};

}   // namespace plotcore
