#include <plotcore/plot.hpp>

namespace plotcore
{

PlotFrame PlotModel::render(std::span<const Rect> viewports)
{
    PlotFrame frame;
    frame.name = name_;
    frame.axes.reserve(axes_.size());
    for (size_t i = 0; i < axes_.size(); ++i)
    {
        Rect viewport = (i < viewports.size()) ? viewports[i] : Rect{};
        frame.axes.push_back(axes_[i]->render(viewport));
    }
    return frame;
}

}   // namespace plotcore
