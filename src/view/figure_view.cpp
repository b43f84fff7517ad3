#include <plotcore/errors.hpp>
#include <plotcore/logger.hpp>
#include <plotcore/view.hpp>

namespace plotcore
{

void paint_frame(const FigureFrame& frame, Painter& painter)
{
    painter.begin_frame(frame);
    for (const auto& plot : frame.plots)
    {
        for (const auto& axes : plot.axes)
            painter.paint_axes(plot, axes);
    }
    painter.end_frame();
}

FigureView::FigureView(SharedFigure figure, RedrawScheduler& scheduler)
    : figure_(std::move(figure)), scheduler_(scheduler)
{
    if (!figure_)
        throw ConstructionError("FigureView needs a figure");
}

FigureFrame FigureView::build_frame(float width, float height, const RebuildFn& rebuild)
{
    FigureFrame frame;
    {
        auto fig = figure_->write();
        if (rebuild)
            rebuild(*fig);
        frame = fig->render(width, height);
    }
    return frame;
}

bool FigureView::draw_if_requested(float            width,
                                   float            height,
                                   Painter&         painter,
                                   const RebuildFn& rebuild)
{
    if (!scheduler_.begin_frame())
        return false;

    last_frame_ = build_frame(width, height, rebuild);
    paint_frame(*last_frame_, painter);

    PLOTCORE_LOG_DEBUG("render",
                       "Painted frame {} ({} drawables)",
                       scheduler_.current_frame().number,
                       last_frame_->drawable_count());
    return true;
}

bool FigureView::repaint(Painter& painter) const
{
    if (!last_frame_)
        return false;
    paint_frame(*last_frame_, painter);
    return true;
}

}   // namespace plotcore
