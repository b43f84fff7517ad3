#pragma once

#include <cmath>
#include <optional>
#include <plotcore/errors.hpp>
#include <plotcore/fwd.hpp>
#include <plotcore/logger.hpp>
#include <span>
#include <string>
#include <type_traits>

namespace plotcore
{

// --- Screen space ---

// Destination rectangle in logical units. y grows downward.
struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float left() const { return x; }
    float top() const { return y; }
    float right() const { return x + w; }
    float bottom() const { return y + h; }

    bool operator==(const Rect&) const = default;
};

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const Vec2&) const = default;
};

// --- Data space ---

template <typename X, typename Y>
struct Point2
{
    X x{};
    Y y{};

    bool operator==(const Point2&) const = default;
};

template <typename X, typename Y>
constexpr Point2<X, Y> point2(X x, Y y)
{
    return Point2<X, Y>{x, y};
}

// One axis worth of data range. Immutable: resize or zoom replaces the
// whole value, which keeps concurrent readers from seeing half an update.
template <typename T>
class AxisRange
{
    static_assert(std::is_arithmetic_v<T>, "AxisRange requires an arithmetic value type");

   public:
    using value_type = T;

    AxisRange() : min_(T(0)), max_(T(1)) {}

    AxisRange(T min, T max) : min_(min), max_(max)
    {
        if constexpr (std::is_floating_point_v<T>)
        {
            if (!std::isfinite(min) || !std::isfinite(max))
            {
                PLOTCORE_LOG_WARN("axes", "Rejected non-finite axis range");
                throw InvalidRangeError("axis range bounds must be finite");
            }
        }
        if (min > max)
        {
            PLOTCORE_LOG_WARN("axes", "Rejected inverted axis range (min > max)");
            throw InvalidRangeError("axis range min (" + std::to_string(min)
                                    + ") is greater than max (" + std::to_string(max) + ")");
        }
    }

    T min() const { return min_; }
    T max() const { return max_; }
    // Computed in double so wide integral ranges cannot overflow.
    double span() const { return static_cast<double>(max_) - static_cast<double>(min_); }

    bool is_degenerate() const { return min_ == max_; }
    bool contains(T v) const { return v >= min_ && v <= max_; }

    // Tightest range over the finite values in `values`; nullopt when there are none.
    static std::optional<AxisRange> fit(std::span<const T> values)
    {
        std::optional<T> lo;
        std::optional<T> hi;
        for (T v : values)
        {
            if constexpr (std::is_floating_point_v<T>)
            {
                if (!std::isfinite(v))
                    continue;
            }
            if (!lo || v < *lo)
                lo = v;
            if (!hi || v > *hi)
                hi = v;
        }
        if (!lo)
            return std::nullopt;
        return AxisRange(*lo, *hi);
    }

    bool operator==(const AxisRange&) const = default;

   private:
    T min_;
    T max_;
};

template <typename X, typename Y>
class AxesBounds
{
   public:
    using x_type = X;
    using y_type = Y;

    AxesBounds() = default;
    AxesBounds(const AxisRange<X>& x, const AxisRange<Y>& y) : x_(x), y_(y) {}

    const AxisRange<X>& x() const { return x_; }
    const AxisRange<Y>& y() const { return y_; }

    bool operator==(const AxesBounds&) const = default;

   private:
    AxisRange<X> x_;
    AxisRange<Y> y_;
};

}   // namespace plotcore
