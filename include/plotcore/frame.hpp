#pragma once

#include <plotcore/axes.hpp>
#include <plotcore/color.hpp>
#include <plotcore/context.hpp>
#include <string>
#include <vector>

namespace plotcore
{

// Output of one render pass, detached from the live model. A painter can
// consume it after the figure lock has been released.

struct AxesFrame
{
    AxesBounds<double, double> bounds;   // data range at the time of the pass
    GridModel                  grid;
    AxisStyle                  style;
    Rect                       viewport;
    DrawList                   drawables;
};

struct PlotFrame
{
    std::string            name;
    std::vector<AxesFrame> axes;
};

struct FigureFrame
{
    std::string            title;
    float                  width  = 0.0f;
    float                  height = 0.0f;
    Color                  background;
    std::vector<PlotFrame> plots;

    size_t axes_count() const
    {
        size_t n = 0;
        for (const auto& p : plots)
            n += p.axes.size();
        return n;
    }

    size_t drawable_count() const
    {
        size_t n = 0;
        for (const auto& p : plots)
            for (const auto& a : p.axes)
                n += a.drawables.size();
        return n;
    }
};

}   // namespace plotcore
