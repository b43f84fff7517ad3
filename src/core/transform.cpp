#include <plotcore/transform.hpp>

namespace plotcore
{

double axis_fraction(double value, double min, double max)
{
    double span = max - min;
    if (span == 0.0)
        return 0.0;
    return (value - min) / span;
}

float data_to_screen_x(double data_x, double x_min, double x_max, const Rect& dest)
{
    return static_cast<float>(dest.x + axis_fraction(data_x, x_min, x_max) * dest.w);
}

float data_to_screen_y(double data_y, double y_min, double y_max, const Rect& dest)
{
    // Measured down from the top edge: (max - y) / span
    double span = y_max - y_min;
    double frac = (span == 0.0) ? 0.0 : (y_max - data_y) / span;
    return static_cast<float>(dest.y + frac * dest.h);
}

Vec2 data_to_screen(double      data_x,
                    double      data_y,
                    double      x_min,
                    double      x_max,
                    double      y_min,
                    double      y_max,
                    const Rect& dest)
{
    return {data_to_screen_x(data_x, x_min, x_max, dest),
            data_to_screen_y(data_y, y_min, y_max, dest)};
}

Point2<double, double> screen_to_data(const Vec2& screen,
                                      double      x_min,
                                      double      x_max,
                                      double      y_min,
                                      double      y_max,
                                      const Rect& dest)
{
    double fx = (dest.w == 0.0f) ? 0.0 : (screen.x - dest.x) / static_cast<double>(dest.w);
    double fy = (dest.h == 0.0f) ? 0.0 : (screen.y - dest.y) / static_cast<double>(dest.h);

    Point2<double, double> out;
    out.x = (x_max == x_min) ? x_min : x_min + fx * (x_max - x_min);
    out.y = (y_max == y_min) ? y_min : y_max - fy * (y_max - y_min);
    return out;
}

}   // namespace plotcore
