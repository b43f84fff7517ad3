#pragma once

#include <memory>
#include <plotcore/color.hpp>
#include <plotcore/fwd.hpp>
#include <plotcore/geometry.hpp>
#include <plotcore/grid.hpp>
#include <plotcore/shared.hpp>
#include <plotcore/transform.hpp>

namespace plotcore
{

struct AxisStyle
{
    bool  grid_enabled   = true;
    bool  border_enabled = true;
    Color grid_color     = colors::light_gray;
    float grid_width     = 1.0f;
    Color border_color   = colors::black;
    float border_width   = 1.0f;

    bool operator==(const AxisStyle&) const = default;
};

// Everything a render pass needs from an axes model, copied out under a
// short read lock so that geometry streaming runs without holding it.
template <typename X, typename Y>
struct AxesSnapshot
{
    AxesBounds<X, Y> bounds;
    GridModel        grid;
    AxisStyle        style;

    Vec2 transform(const Point2<X, Y>& p, const Rect& dest) const
    {
        return data_to_screen(bounds, p, dest);
    }
};

// One rectangular coordinate frame: data bounds, grid divisions and axis
// styling. Normally lives inside a Shared<> (see SharedAxes) so that other
// threads can re-range it between frames; a bounds change is a single
// assignment under the write lock.
template <typename X, typename Y>
class AxesModel
{
   public:
    using x_type = X;
    using y_type = Y;

    explicit AxesModel(const AxesBounds<X, Y>& bounds, const GridModel& grid = {})
        : bounds_(bounds), grid_(grid)
    {
    }

    const AxesBounds<X, Y>& bounds() const { return bounds_; }
    void                    set_bounds(const AxesBounds<X, Y>& bounds) { bounds_ = bounds; }

    const GridModel& grid() const { return grid_; }
    void             set_grid(const GridModel& grid) { grid_ = grid; }

    AxisStyle&       axis_style() { return style_; }
    const AxisStyle& axis_style() const { return style_; }

    Vec2 transform(const Point2<X, Y>& p, const Rect& dest) const
    {
        return data_to_screen(bounds_, p, dest);
    }

    Point2<double, double> inverse_transform(const Vec2& screen, const Rect& dest) const
    {
        return screen_to_data(bounds_, screen, dest);
    }

    GridLines<X, Y> grid_lines() const { return grid_.generate(bounds_); }

    AxesSnapshot<X, Y> snapshot() const { return {bounds_, grid_, style_}; }

   private:
    AxesBounds<X, Y> bounds_;
    GridModel        grid_;
    AxisStyle        style_;
};

template <typename X, typename Y>
SharedAxes<X, Y> make_axes(const AxesBounds<X, Y>& bounds, const GridModel& grid = {})
{
    return make_shared_model<AxesModel<X, Y>>(bounds, grid);
}

}   // namespace plotcore
