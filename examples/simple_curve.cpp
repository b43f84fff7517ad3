// Plots y = sin(x) and y = cos(x) over [0, 2π] and prints the frame as SVG.
//
// Shows the rebuild-every-frame pattern: the axes model lives outside the
// figure and is re-attached on each pass, while the geometry is regenerated.

#include <cmath>
#include <iostream>
#include <numbers>
#include <plotcore/plotcore.hpp>

namespace
{

class SineCurve final : public plotcore::GeometryAxes<double, double>
{
   public:
    void render_axes(plotcore::AxesContext<double, double>& cx) override
    {
        constexpr double step = 0.05;
        const double     end  = 2.0 * std::numbers::pi;

        auto sine = plotcore::Line<>().color(plotcore::colors::blue).label("sin(x)");
        for (double x = 0.0; x <= end; x += step)
            sine.add_point(plotcore::point2(x, std::sin(x)));
        sine.render_axes(cx);

        auto cosine = plotcore::Line<>().color(plotcore::colors::red).label("cos(x)");
        for (double x = 0.0; x <= end; x += step)
            cosine.add_point(plotcore::point2(x, std::cos(x)));
        cosine.render_axes(cx);
    }
};

}   // namespace

int main()
{
    using namespace plotcore;

    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    auto figure = make_figure("Simple Curve Plot - y = sin(x)", {.width = 800.0f, .height = 600.0f});

    AxesBounds<double, double> bounds(AxisRange<double>(0.0, 2.0 * std::numbers::pi),
                                      AxisRange<double>(-1.5, 1.5));
    auto axes = make_axes(bounds, GridModel::from_numbers(10, 8));

    RedrawScheduler scheduler;
    FigureView      view(figure, scheduler);
    view.watch(*axes);

    SvgPainter painter;
    scheduler.request_redraw();

    // A few passes of the event loop. The axes are re-ranged once in
    // between, which schedules one more frame through the watch above.
    for (int tick = 0; tick < 3; ++tick)
    {
        view.draw_if_requested(800.0f,
                               600.0f,
                               painter,
                               [&](FigureModel& model)
                               {
                                   model.clear_plots();
                                   model.add_plot_with(
                                       [&](PlotModel& plot)
                                       {
                                           plot.add_axes_with(axes,
                                                              [](AxesElements<double, double>& el)
                                                              {
                                                                  el.clear_elements();
                                                                  el.plot(SineCurve{});
                                                              });
                                       });
                               });

        if (tick == 0)
        {
            auto guard = axes->write();
            guard->set_bounds(AxesBounds<double, double>(
                AxisRange<double>(0.0, 2.0 * std::numbers::pi), AxisRange<double>(-1.2, 1.2)));
        }
    }

    std::cout << painter.svg();
    return 0;
}
