#include <algorithm>
#include <gtest/gtest.h>
#include <plotcore/grid.hpp>
#include <vector>

using namespace plotcore;

TEST(GridModel, DefaultHasNoDivisions)
{
    GridModel g;
    EXPECT_EQ(g.x_divisions(), 0);
    EXPECT_EQ(g.y_divisions(), 0);
}

TEST(GridModel, FromNumbers)
{
    auto g = GridModel::from_numbers(10, 8);
    EXPECT_EQ(g.x_divisions(), 10);
    EXPECT_EQ(g.y_divisions(), 8);
    EXPECT_EQ(g, GridModel::from_numbers(10, 8));
    EXPECT_FALSE(g == GridModel::from_numbers(8, 10));
}

TEST(GridModel, NegativeCountsThrow)
{
    EXPECT_THROW(GridModel::from_numbers(-1, 8), InvalidGridError);
    EXPECT_THROW(GridModel::from_numbers(4, -2), InvalidGridError);
    EXPECT_THROW(GridModel::from_numbers(-1, -1), ConstructionError);
}

TEST(GridModel, PositionCountAndEndpoints)
{
    const AxisRange<double> ranges[] = {{0.0, 1.0}, {-7.25, 3.5}, {100.0, 100.001}};
    for (const auto& r : ranges)
    {
        for (int d = 1; d <= 20; ++d)
        {
            auto pos = grid_positions(r, d);
            ASSERT_EQ(pos.size(), static_cast<size_t>(d + 1));
            EXPECT_EQ(pos.front(), r.min());
            EXPECT_EQ(pos.back(), r.max());
            for (size_t i = 1; i < pos.size(); ++i)
                EXPECT_LT(pos[i - 1], pos[i]) << "d=" << d << " i=" << i;
        }
    }
}

TEST(GridModel, EvenSpacing)
{
    auto pos = grid_positions(AxisRange<double>(0.0, 10.0), 4);
    ASSERT_EQ(pos.size(), 5u);
    EXPECT_DOUBLE_EQ(pos[1], 2.5);
    EXPECT_DOUBLE_EQ(pos[2], 5.0);
    EXPECT_DOUBLE_EQ(pos[3], 7.5);
}

TEST(GridModel, ZeroDivisionsGivesEndpoints)
{
    auto pos = grid_positions(AxisRange<double>(-1.0, 1.0), 0);
    ASSERT_EQ(pos.size(), 2u);
    EXPECT_DOUBLE_EQ(pos[0], -1.0);
    EXPECT_DOUBLE_EQ(pos[1], 1.0);
}

TEST(GridModel, DegenerateRangeRepeatsMin)
{
    auto pos = grid_positions(AxisRange<double>(2.0, 2.0), 3);
    ASSERT_EQ(pos.size(), 4u);
    for (double v : pos)
        EXPECT_DOUBLE_EQ(v, 2.0);
}

TEST(GridModel, IntegralRangeRounds)
{
    auto pos = grid_positions(AxisRange<int>(0, 10), 3);
    ASSERT_EQ(pos.size(), 4u);
    EXPECT_EQ(pos[0], 0);
    EXPECT_EQ(pos[1], 3);   // 3.33
    EXPECT_EQ(pos[2], 7);   // 6.67
    EXPECT_EQ(pos[3], 10);
}

TEST(GridModel, GenerateUsesBothAxes)
{
    auto                    g = GridModel::from_numbers(2, 4);
    AxesBounds<double, int> b(AxisRange<double>(0.0, 1.0), AxisRange<int>(0, 100));
    auto                    lines = g.generate(b);
    ASSERT_EQ(lines.x.size(), 3u);
    ASSERT_EQ(lines.y.size(), 5u);
    EXPECT_DOUBLE_EQ(lines.x[1], 0.5);
    EXPECT_EQ(lines.y[1], 25);
    EXPECT_EQ(lines.y[4], 100);
}

TEST(GridModel, ReusableAcrossBounds)
{
    const auto g = GridModel::from_numbers(5, 5);

    AxesBounds<double, double> a(AxisRange<double>(0.0, 5.0), AxisRange<double>(0.0, 5.0));
    AxesBounds<double, double> b(AxisRange<double>(-50.0, 50.0), AxisRange<double>(1.0, 2.0));

    auto first  = g.generate(a);
    auto second = g.generate(b);
    auto again  = g.generate(a);

    EXPECT_EQ(first.x, again.x);
    EXPECT_EQ(first.y, again.y);
    EXPECT_DOUBLE_EQ(second.x.front(), -50.0);
    EXPECT_DOUBLE_EQ(second.y.back(), 2.0);
}

TEST(GridModel, PositionsStayInsideBounds)
{
    auto                       g = GridModel::from_numbers(7, 13);
    AxesBounds<double, double> b(AxisRange<double>(-3.3, 9.1), AxisRange<double>(0.001, 0.002));
    auto                       lines = g.generate(b);
    for (double x : lines.x)
        EXPECT_TRUE(b.x().contains(x));
    for (double y : lines.y)
        EXPECT_TRUE(b.y().contains(y));
}

TEST(GridModel, IntegralRangeNeverRepeatsPositions)
{
    auto pos = grid_positions(AxisRange<int>(0, 3), 10);
    EXPECT_EQ(pos, (std::vector<int>{0, 1, 2, 3}));

    for (int d = 1; d <= 40; ++d)
    {
        auto p = grid_positions(AxisRange<int>(-7, 5), d);
        EXPECT_EQ(p.front(), -7);
        EXPECT_EQ(p.back(), 5);
        EXPECT_EQ(p.size(), static_cast<size_t>(std::min(d, 12) + 1)) << "d=" << d;
        for (size_t i = 1; i < p.size(); ++i)
            EXPECT_LT(p[i - 1], p[i]) << "d=" << d << " i=" << i;
    }
}

TEST(GridModel, IntegralDivisionsWithinSpanAreKept)
{
    auto pos = grid_positions(AxisRange<int>(0, 100), 10);
    EXPECT_EQ(pos.size(), 11u);
}
