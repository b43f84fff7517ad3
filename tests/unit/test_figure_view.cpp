#include <atomic>
#include <gtest/gtest.h>
#include <plotcore/series.hpp>
#include <plotcore/view.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace plotcore;

// ─── Recording painter ───────────────────────────────────────────────────────

class RecordingPainter : public Painter
{
   public:
    void begin_frame(const FigureFrame& frame) override
    {
        calls.push_back("begin:" + frame.title);
    }

    void paint_axes(const PlotFrame& plot, const AxesFrame& axes) override
    {
        calls.push_back("axes:" + plot.name + ":" + std::to_string(axes.drawables.size()));
        if (on_axes)
            on_axes();
    }

    void end_frame() override { calls.push_back("end"); }

    std::vector<std::string> calls;
    std::function<void()>    on_axes;
};

namespace
{

SharedAxes<double, double> make_unit_axes()
{
    return make_axes(
        AxesBounds<double, double>(AxisRange<double>(0.0, 1.0), AxisRange<double>(0.0, 1.0)));
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// RedrawScheduler
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RedrawScheduler, NothingPendingInitially)
{
    RedrawScheduler s;
    EXPECT_FALSE(s.redraw_pending());
    EXPECT_FALSE(s.begin_frame());
    EXPECT_EQ(s.current_frame().number, 0u);
}

TEST(RedrawScheduler, RequestsCoalesce)
{
    RedrawScheduler s;
    s.request_redraw();
    s.request_redraw();
    s.request_redraw();
    EXPECT_TRUE(s.redraw_pending());
    EXPECT_EQ(s.requests(), 3u);
    EXPECT_EQ(s.coalesced(), 2u);

    EXPECT_TRUE(s.begin_frame());
    EXPECT_FALSE(s.redraw_pending());
    EXPECT_FALSE(s.begin_frame());
}

TEST(RedrawScheduler, FrameNumbersAdvance)
{
    RedrawScheduler s;
    s.request_redraw();
    ASSERT_TRUE(s.begin_frame());
    EXPECT_EQ(s.current_frame().number, 0u);
    EXPECT_FLOAT_EQ(s.current_frame().dt, 0.0f);

    s.request_redraw();
    ASSERT_TRUE(s.begin_frame());
    EXPECT_EQ(s.current_frame().number, 1u);
    EXPECT_GE(s.current_frame().elapsed_sec, 0.0f);
}

TEST(RedrawScheduler, RequestsFromManyThreads)
{
    RedrawScheduler          s;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&]
            {
                for (int i = 0; i < 250; ++i)
                    s.request_redraw();
            });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(s.requests(), 1000u);
    EXPECT_EQ(s.coalesced(), 999u);
    EXPECT_TRUE(s.begin_frame());
    EXPECT_FALSE(s.begin_frame());
}

// ═══════════════════════════════════════════════════════════════════════════════
// FigureView
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FigureView, NullFigureThrows)
{
    RedrawScheduler s;
    EXPECT_THROW(FigureView(nullptr, s), ConstructionError);
}

TEST(FigureView, DrawsOnlyWhenRequested)
{
    RedrawScheduler  s;
    FigureView       view(make_figure("view"), s);
    RecordingPainter painter;

    EXPECT_FALSE(view.draw_if_requested(400.0f, 300.0f, painter));
    EXPECT_TRUE(painter.calls.empty());
    EXPECT_FALSE(view.last_frame().has_value());

    s.request_redraw();
    EXPECT_TRUE(view.draw_if_requested(400.0f, 300.0f, painter));
    ASSERT_EQ(painter.calls.size(), 2u);
    EXPECT_EQ(painter.calls[0], "begin:view");
    EXPECT_EQ(painter.calls[1], "end");

    EXPECT_FALSE(view.draw_if_requested(400.0f, 300.0f, painter));
}

TEST(FigureView, PaintsInTraversalOrder)
{
    RedrawScheduler s;
    auto            axes = make_unit_axes();
    FigureView      view(make_figure("order"), s);

    auto rebuild = [&](FigureModel& fig)
    {
        fig.clear_plots();
        fig.add_plot_with("a",
                          [&](PlotModel& p)
                          {
                              p.add_axes(axes);
                              p.add_axes(axes);
                          });
        fig.add_plot_with("b", [&](PlotModel& p) { p.add_axes(axes); });
    };

    RecordingPainter painter;
    s.request_redraw();
    ASSERT_TRUE(view.draw_if_requested(600.0f, 400.0f, painter, rebuild));

    // each empty axes has 4 edge grid lines and 4 border segments
    std::vector<std::string> expected = {"begin:order", "axes:a:8", "axes:a:8", "axes:b:8", "end"};
    EXPECT_EQ(painter.calls, expected);
}

TEST(FigureView, RebuildRunsEveryPass)
{
    RedrawScheduler s;
    FigureView      view(make_figure("rebuild"), s);
    auto            axes   = make_unit_axes();
    int             passes = 0;

    auto rebuild = [&](FigureModel& fig)
    {
        ++passes;
        fig.clear_plots();
        fig.add_plot_with([&](PlotModel& p) { p.add_axes(axes); });
    };

    RecordingPainter painter;
    for (int i = 0; i < 3; ++i)
    {
        s.request_redraw();
        ASSERT_TRUE(view.draw_if_requested(200.0f, 200.0f, painter, rebuild));
    }
    EXPECT_EQ(passes, 3);
    EXPECT_EQ(view.figure()->read()->plot_count(), 1u);
}

TEST(FigureView, WatchedAxesRequestRedraw)
{
    RedrawScheduler s;
    auto            axes = make_unit_axes();
    FigureView      view(make_figure("watch"), s);
    view.watch(*axes);

    EXPECT_FALSE(s.redraw_pending());
    axes->write()->set_bounds(
        AxesBounds<double, double>(AxisRange<double>(0.0, 2.0), AxisRange<double>(0.0, 2.0)));
    EXPECT_TRUE(s.redraw_pending());

    // a read never requests a frame
    ASSERT_TRUE(s.begin_frame());
    (void)axes->read()->bounds();
    EXPECT_FALSE(s.redraw_pending());
}

TEST(FigureView, FigureUnlockedWhilePainting)
{
    RedrawScheduler s;
    auto            figure = make_figure("unlocked");
    FigureView      view(figure, s);
    auto            axes = make_unit_axes();

    RecordingPainter painter;
    bool             wrote = false;

    painter.on_axes = [&]
    {
        // would deadlock if the pass still held the figure lock
        figure->write()->title("renamed");
        wrote = true;
    };

    s.request_redraw();
    ASSERT_TRUE(view.draw_if_requested(
        100.0f,
        100.0f,
        painter,
        [&](FigureModel& fig)
        {
            fig.clear_plots();
            fig.add_plot_with([&](PlotModel& p) { p.add_axes(axes); });
        }));

    EXPECT_TRUE(wrote);
    EXPECT_EQ(figure->read()->title(), "renamed");
    EXPECT_EQ(view.last_frame()->title, "unlocked");
}

TEST(FigureView, RepaintReusesLastFrame)
{
    RedrawScheduler  s;
    FigureView       view(make_figure("again"), s);
    RecordingPainter painter;

    EXPECT_FALSE(view.repaint(painter));

    s.request_redraw();
    ASSERT_TRUE(view.draw_if_requested(100.0f, 100.0f, painter));
    painter.calls.clear();

    EXPECT_TRUE(view.repaint(painter));
    EXPECT_EQ(painter.calls.front(), "begin:again");
    EXPECT_FALSE(s.redraw_pending());
}

TEST(FigureView, BackgroundWriterThenRedraw)
{
    RedrawScheduler s;
    auto            axes = make_unit_axes();
    FigureView      view(make_figure("bg"), s);
    view.watch(*axes);

    std::thread writer(
        [&]
        {
            for (int i = 1; i <= 50; ++i)
            {
                axes->write()->set_bounds(AxesBounds<double, double>(
                    AxisRange<double>(0.0, static_cast<double>(i)), AxisRange<double>(0.0, 1.0)));
            }
        });
    writer.join();

    RecordingPainter painter;
    auto             rebuild = [&](FigureModel& fig)
    {
        fig.clear_plots();
        fig.add_plot_with([&](PlotModel& p) { p.add_axes(axes); });
    };
    EXPECT_TRUE(view.draw_if_requested(100.0f, 100.0f, painter, rebuild));
    EXPECT_FALSE(view.draw_if_requested(100.0f, 100.0f, painter, rebuild));
    EXPECT_DOUBLE_EQ(view.last_frame()->plots[0].axes[0].bounds.x().max(), 50.0);
}

TEST(FigureView, DestroyedViewStopsWatching)
{
    auto axes = make_unit_axes();
    {
        RedrawScheduler s;
        FigureView      view(make_figure("scoped"), s);
        view.watch(*axes);
        EXPECT_EQ(view.watch_count(), 1u);
        EXPECT_EQ(axes->listener_count(), 1u);
    }
    EXPECT_EQ(axes->listener_count(), 0u);

    // The scheduler is gone; a later write must not reach it.
    axes->write()->set_bounds(
        AxesBounds<double, double>(AxisRange<double>(0.0, 3.0), AxisRange<double>(0.0, 3.0)));
    EXPECT_DOUBLE_EQ(axes->read()->bounds().x().max(), 3.0);
}

TEST(FigureView, DestroyedViewStopsWatchingBackgroundWriter)
{
    auto              axes = make_unit_axes();
    std::atomic<bool> stop{false};

    std::thread writer(
        [&]
        {
            double hi = 1.0;
            while (!stop.load())
            {
                hi += 1.0;
                axes->write()->set_bounds(AxesBounds<double, double>(
                    AxisRange<double>(0.0, hi), AxisRange<double>(0.0, 1.0)));
            }
        });

    for (int i = 0; i < 50; ++i)
    {
        RedrawScheduler s;
        FigureView      view(make_figure("churn"), s);
        view.watch(*axes);
    }

    stop.store(true);
    writer.join();
    EXPECT_EQ(axes->listener_count(), 0u);
}

TEST(FigureView, TwoViewsWatchOneSharedAxes)
{
    auto            axes = make_unit_axes();
    RedrawScheduler s1;
    RedrawScheduler s2;
    FigureView      v1(make_figure("one"), s1);
    FigureView      v2(make_figure("two"), s2);
    v1.watch(*axes);
    v2.watch(*axes);

    axes->write()->set_bounds(
        AxesBounds<double, double>(AxisRange<double>(0.0, 5.0), AxisRange<double>(0.0, 5.0)));
    EXPECT_TRUE(s1.redraw_pending());
    EXPECT_TRUE(s2.redraw_pending());
}

TEST(FigureView, UnwatchAll)
{
    RedrawScheduler s;
    auto            axes = make_unit_axes();
    FigureView      view(make_figure("unwatch"), s);
    view.watch(*axes);
    view.unwatch_all();
    EXPECT_EQ(view.watch_count(), 0u);

    *axes->write() = AxesModel<double, double>(
        AxesBounds<double, double>(AxisRange<double>(0.0, 2.0), AxisRange<double>(0.0, 2.0)));
    EXPECT_FALSE(s.redraw_pending());
}
