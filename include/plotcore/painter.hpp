#pragma once

#include <plotcore/frame.hpp>

namespace plotcore
{

// Window-system side of the boundary. Receives a finished frame in
// traversal order: begin_frame, paint_axes for every axes of every plot,
// end_frame. Implementations own whatever surface they draw to.
class Painter
{
   public:
    virtual ~Painter() = default;

    virtual void begin_frame(const FigureFrame& frame)                    = 0;
    virtual void paint_axes(const PlotFrame& plot, const AxesFrame& axes) = 0;
    virtual void end_frame()                                              = 0;
};

void paint_frame(const FigureFrame& frame, Painter& painter);

}   // namespace plotcore
