#pragma once

#include <plotcore/geometry.hpp>

namespace plotcore
{

// Coordinate transform between data space and screen space.
// x maps left to right; y is flipped so data max lands on the top edge.
// A zero-span range has fraction 0 everywhere and anchors to dest.x / dest.y.
// No clipping: values outside the range extrapolate linearly.

// (value - min) / (max - min), or 0 when max == min.
double axis_fraction(double value, double min, double max);

float data_to_screen_x(double data_x, double x_min, double x_max, const Rect& dest);
float data_to_screen_y(double data_y, double y_min, double y_max, const Rect& dest);

Vec2 data_to_screen(double      data_x,
                    double      data_y,
                    double      x_min,
                    double      x_max,
                    double      y_min,
                    double      y_max,
                    const Rect& dest);

// Inverse mapping. A zero-span axis maps back to its min; a zero-sized rect
// maps to its origin corner (x_min, y_max).
Point2<double, double> screen_to_data(const Vec2& screen,
                                      double      x_min,
                                      double      x_max,
                                      double      y_min,
                                      double      y_max,
                                      const Rect& dest);

template <typename X, typename Y>
Vec2 data_to_screen(const AxesBounds<X, Y>& bounds, const Point2<X, Y>& p, const Rect& dest)
{
    return data_to_screen(static_cast<double>(p.x),
                          static_cast<double>(p.y),
                          static_cast<double>(bounds.x().min()),
                          static_cast<double>(bounds.x().max()),
                          static_cast<double>(bounds.y().min()),
                          static_cast<double>(bounds.y().max()),
                          dest);
}

template <typename X, typename Y>
Point2<double, double> screen_to_data(const AxesBounds<X, Y>& bounds,
                                      const Vec2&             screen,
                                      const Rect&             dest)
{
    return screen_to_data(screen,
                          static_cast<double>(bounds.x().min()),
                          static_cast<double>(bounds.x().max()),
                          static_cast<double>(bounds.y().min()),
                          static_cast<double>(bounds.y().max()),
                          dest);
}

}   // namespace plotcore
