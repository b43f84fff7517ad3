#include <plotcore/figure.hpp>
#include <plotcore/logger.hpp>
#include <stdexcept>

#include "layout.hpp"

namespace plotcore
{

FigureModel::FigureModel(std::string title, const FigureConfig& config)
    : title_(std::move(title)), config_(config)
{
}

void FigureModel::resize(float width, float height)
{
    config_.width  = width;
    config_.height = height;
}

void FigureModel::clear_plots()
{
    if (!plots_.empty())
        PLOTCORE_LOG_TRACE("figure", "Clearing {} plots from '{}'", plots_.size(), title_);
    plots_.clear();
}

PlotModel& FigureModel::add_plot_with(const PlotBuilder& builder)
{
    return add_plot_with(std::string(), builder);
}

PlotModel& FigureModel::add_plot_with(const std::string& name, const PlotBuilder& builder)
{
    auto plot = std::make_unique<PlotModel>(name);
    if (builder)
        builder(*plot);
    auto& ref = *plot;
    plots_.push_back(std::move(plot));
    return ref;
}

PlotModel& FigureModel::plot(size_t index)
{
    if (index >= plots_.size())
    {
        throw std::out_of_range("plot index " + std::to_string(index) + " out of range ("
                                + std::to_string(plots_.size()) + " plots)");
    }
    return *plots_[index];
}

std::vector<std::vector<Rect>> FigureModel::compute_layout(float width, float height) const
{
    Margins margins;
    margins.left   = style_.margin_left;
    margins.right  = style_.margin_right;
    margins.top    = style_.margin_top;
    margins.bottom = style_.margin_bottom;

    std::vector<std::vector<Rect>> out;
    out.reserve(plots_.size());

    auto rows = compute_grid_layout(Rect{0.0f, 0.0f, width, height},
                                    static_cast<int>(plots_.size()),
                                    1);
    for (size_t i = 0; i < plots_.size(); ++i)
    {
        out.push_back(compute_grid_layout(rows[i],
                                          1,
                                          static_cast<int>(plots_[i]->axes_count()),
                                          margins));
    }
    return out;
}

FigureFrame FigureModel::render(const ViewportFn& viewport_for)
{
    FigureFrame frame;
    frame.title      = title_;
    frame.width      = config_.width;
    frame.height     = config_.height;
    frame.background = style_.background;
    frame.plots.reserve(plots_.size());

    for (size_t p = 0; p < plots_.size(); ++p)
    {
        std::vector<Rect> viewports;
        viewports.reserve(plots_[p]->axes_count());
        for (size_t a = 0; a < plots_[p]->axes_count(); ++a)
            viewports.push_back(viewport_for ? viewport_for(p, a) : Rect{});
        frame.plots.push_back(plots_[p]->render(viewports));
    }

    PLOTCORE_LOG_DEBUG("render",
                       "Figure '{}': {} plots, {} axes, {} drawables",
                       title_,
                       frame.plots.size(),
                       frame.axes_count(),
                       frame.drawable_count());
    return frame;
}

FigureFrame FigureModel::render(float width, float height)
{
    auto layout  = compute_layout(width, height);
    auto frame   = render([&layout](size_t p, size_t a) { return layout[p][a]; });
    frame.width  = width;
    frame.height = height;
    return frame;
}

FigureFrame FigureModel::render()
{
    return render(config_.width, config_.height);
}

}   // namespace plotcore
