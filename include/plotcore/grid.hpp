#pragma once

#include <cmath>
#include <plotcore/geometry.hpp>
#include <type_traits>
#include <vector>

namespace plotcore
{

template <typename X, typename Y>
struct GridLines
{
    std::vector<X> x;
    std::vector<Y> y;
};

// Evenly spaced positions across `range`, both endpoints included.
// divisions == 0 yields just the two endpoints. Integral ranges round
// the interior positions to the nearest representable value, and a
// non-degenerate integral range never gets more divisions than its span,
// so positions stay strictly increasing.
template <typename T>
std::vector<T> grid_positions(const AxisRange<T>& range, int divisions)
{
    if constexpr (std::is_integral_v<T>)
    {
        const double span = range.span();
        if (span >= 1.0 && span < static_cast<double>(divisions))
            divisions = static_cast<int>(span);
    }

    std::vector<T> out;
    if (divisions <= 0)
    {
        out.push_back(range.min());
        out.push_back(range.max());
        return out;
    }

    out.reserve(static_cast<size_t>(divisions) + 1);
    const double lo   = static_cast<double>(range.min());
    const double span = static_cast<double>(range.max()) - lo;
    out.push_back(range.min());
    for (int i = 1; i < divisions; ++i)
    {
        double v = lo + span * static_cast<double>(i) / static_cast<double>(divisions);
        if constexpr (std::is_integral_v<T>)
            out.push_back(static_cast<T>(std::llround(v)));
        else
            out.push_back(static_cast<T>(v));
    }
    out.push_back(range.max());
    return out;
}

// Division counts only; positions are derived per call from whatever
// bounds the caller passes, so one GridModel can serve many axes.
class GridModel
{
   public:
    GridModel() = default;

    // Throws InvalidGridError if either count is negative.
    static GridModel from_numbers(int x_divisions, int y_divisions);

    int x_divisions() const { return x_divisions_; }
    int y_divisions() const { return y_divisions_; }

    template <typename X, typename Y>
    GridLines<X, Y> generate(const AxesBounds<X, Y>& bounds) const
    {
        return {grid_positions(bounds.x(), x_divisions_), grid_positions(bounds.y(), y_divisions_)};
    }

    bool operator==(const GridModel&) const = default;

   private:
    GridModel(int x_divisions, int y_divisions)
        : x_divisions_(x_divisions), y_divisions_(y_divisions)
    {
    }

    int x_divisions_ = 0;
    int y_divisions_ = 0;
};

}   // namespace plotcore
