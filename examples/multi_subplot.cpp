// Two plots sharing one axes model, plus a scatter and a procedural curve.

#include <cmath>
#include <iostream>
#include <plotcore/plotcore.hpp>

int main()
{
    using namespace plotcore;

    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    auto shared_axes = make_axes(
        AxesBounds<double, double>(AxisRange<double>(-5.0, 5.0), AxisRange<double>(-1.0, 1.0)),
        GridModel::from_numbers(10, 4));
    auto int_axes = make_axes(
        AxesBounds<int, int>(AxisRange<int>(0, 10), AxisRange<int>(0, 100)),
        GridModel::from_numbers(5, 5));

    FigureModel figure("Subplots", {.width = 1000.0f, .height = 700.0f});

    figure.add_plot_with("functions",
                         [&](PlotModel& plot)
                         {
                             plot.add_axes_with(shared_axes,
                                                [](AxesElements<double, double>& el)
                                                {
                                                    auto tanh_curve = FunctionCurve<>(
                                                        [](double x) { return std::tanh(x); }, 200);
                                                    el.plot(std::move(tanh_curve).format("g-."));
                                                });
                             plot.add_axes_with(int_axes,
                                                [](AxesElements<int, int>& el)
                                                {
                                                    Points<int, int> squares;
                                                    for (int i = 0; i <= 10; ++i)
                                                        squares.add_point({i, i * i});
                                                    el.plot(std::move(squares).format("ms"));
                                                });
                         });

    figure.add_plot_with("same axes, different geometry",
                         [&](PlotModel& plot)
                         {
                             plot.add_axes_with(shared_axes,
                                                [](AxesElements<double, double>& el)
                                                {
                                                    Line<> line;
                                                    for (int i = -50; i <= 50; ++i)
                                                    {
                                                        double x = i * 0.1;
                                                        line.add_point({x, std::sin(x)});
                                                    }
                                                    el.plot(std::move(line).format("b--"));
                                                });
                         });

    std::cout << render_svg(figure.render());
    return 0;
}
