#pragma once

#include <plotcore/painter.hpp>
#include <sstream>
#include <string>

namespace plotcore
{

// Painter that serialises a frame to an SVG document held in memory.
// Each axes becomes a <g> clipped to its viewport; segments become <line>,
// markers become <circle>/<rect>/<path> by marker style.
class SvgPainter final : public Painter
{
   public:
    void begin_frame(const FigureFrame& frame) override;
    void paint_axes(const PlotFrame& plot, const AxesFrame& axes) override;
    void end_frame() override;

    // Complete document after end_frame(); partial while painting.
    std::string svg() const { return out_.str(); }

   private:
    std::ostringstream out_;
    size_t             clip_id_ = 0;
};

std::string render_svg(const FigureFrame& frame);

}   // namespace plotcore
