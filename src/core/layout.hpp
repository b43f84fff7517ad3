#pragma once

#include <plotcore/geometry.hpp>
#include <vector>

namespace plotcore
{

// Margins in logical units around each cell's plot area.
struct Margins
{
    float left   = 0.0f;
    float right  = 0.0f;
    float bottom = 0.0f;
    float top    = 0.0f;
};

// Split a region into a rows x cols grid of equal cells and shrink each cell
// by the margins. Row-major, row 0 at the top. Degenerate cells clamp to zero
// size instead of going negative.
std::vector<Rect> compute_grid_layout(const Rect& region, int rows, int cols, const Margins& margins = {});

}   // namespace plotcore
