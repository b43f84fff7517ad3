#pragma once

#include <functional>
#include <memory>
#include <plotcore/color.hpp>
#include <plotcore/frame.hpp>
#include <plotcore/fwd.hpp>
#include <plotcore/plot.hpp>
#include <plotcore/shared.hpp>
#include <string>
#include <vector>

namespace plotcore
{

struct FigureConfig
{
    float width  = 800.0f;
    float height = 600.0f;
};

struct FigureStyle
{
    Color background    = colors::white;
    float margin_top    = 30.0f;
    float margin_bottom = 40.0f;
    float margin_left   = 50.0f;
    float margin_right  = 20.0f;
};

// Top-level container handed to the painter. The usual pattern is a full
// clear-and-rebuild each frame: clear_plots(), then add_plot_with() for
// every plot, re-attaching long-lived shared axes models.
class FigureModel
{
   public:
    using PlotBuilder = std::function<void(PlotModel&)>;
    // Destination rect for axes `axes_index` of plot `plot_index`.
    using ViewportFn = std::function<Rect(size_t plot_index, size_t axes_index)>;

    explicit FigureModel(std::string title = "Figure", const FigureConfig& config = {});

    const std::string& title() const { return title_; }
    void               title(const std::string& t) { title_ = t; }

    const FigureConfig& config() const { return config_; }
    void                resize(float width, float height);

    FigureStyle&       style() { return style_; }
    const FigureStyle& style() const { return style_; }

    // Drops every plot. Shared axes models held elsewhere survive and are
    // simply detached. Calling it on an empty figure is a no-op.
    void clear_plots();

    PlotModel& add_plot_with(const PlotBuilder& builder);
    PlotModel& add_plot_with(const std::string& name, const PlotBuilder& builder);

    size_t                                         plot_count() const { return plots_.size(); }
    bool                                           empty() const { return plots_.empty(); }
    const std::vector<std::unique_ptr<PlotModel>>& plots() const { return plots_; }
    PlotModel&                                     plot(size_t index);

    // Number of axes slots, across all plots, that render against `model`.
    template <typename X, typename Y>
    size_t attachment_count(const SharedAxes<X, Y>& model) const
    {
        size_t n = 0;
        for (const auto& p : plots_)
            for (const auto& a : p->axes())
                if (a->uses_model(model.get()))
                    ++n;
        return n;
    }

    // Default layout: one row per plot, the plot's axes side by side, with
    // the style margins applied inside each cell.
    std::vector<std::vector<Rect>> compute_layout(float width, float height) const;

    FigureFrame render(const ViewportFn& viewport_for);
    FigureFrame render(float width, float height);
    FigureFrame render();

   private:
    std::string                             title_;
    FigureConfig                            config_;
    FigureStyle                             style_;
    std::vector<std::unique_ptr<PlotModel>> plots_;
};

inline SharedFigure make_figure(std::string title, const FigureConfig& config = {})
{
    return make_shared_model<FigureModel>(std::move(title), config);
}

}   // namespace plotcore
