#pragma once

#include <functional>
#include <optional>
#include <plotcore/figure.hpp>
#include <plotcore/painter.hpp>
#include <plotcore/scheduler.hpp>
#include <plotcore/shared.hpp>
#include <vector>

namespace plotcore
{

// Drives render passes for one shared figure.
//
// A pass takes the figure's write lock, runs the caller's clear-and-rebuild
// callback, streams every axes into a FigureFrame and drops the lock. Only
// then is the frame handed to the painter, so painting never blocks writers.
// The scheduler must outlive the view. Models the view watches may outlive
// it; their listeners are removed when the view is destroyed.
class FigureView
{
   public:
    using RebuildFn = std::function<void(FigureModel&)>;

    FigureView(SharedFigure figure, RedrawScheduler& scheduler);

    FigureView(const FigureView&)            = delete;
    FigureView& operator=(const FigureView&) = delete;

    const SharedFigure& figure() const { return figure_; }
    RedrawScheduler&    scheduler() { return scheduler_; }

    FigureFrame build_frame(float width, float height, const RebuildFn& rebuild = {});

    // Runs a pass and paints it if a redraw was requested. Returns whether
    // anything was painted.
    bool draw_if_requested(float width, float height, Painter& painter, const RebuildFn& rebuild = {});

    // Repaints the most recent frame without rebuilding. False if none yet.
    bool repaint(Painter& painter) const;

    const std::optional<FigureFrame>& last_frame() const { return last_frame_; }

    // Every released write lock on `model` requests a redraw until the view
    // is destroyed or unwatch_all() is called. Any number of views may watch
    // the same model. Watching the figure itself turns each pass into a
    // request for the next one.
    template <typename T>
    void watch(Shared<T>& model)
    {
        RedrawScheduler* scheduler = &scheduler_;
        subscriptions_.push_back(model.on_change([scheduler] { scheduler->request_redraw(); }));
    }

    void   unwatch_all() { subscriptions_.clear(); }
    size_t watch_count() const { return subscriptions_.size(); }

   private:
    SharedFigure               figure_;
    RedrawScheduler&           scheduler_;
    std::optional<FigureFrame> last_frame_;
    std::vector<Subscription>  subscriptions_;
};

}   // namespace plotcore
