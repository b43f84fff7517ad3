#include "layout.hpp"

#include <algorithm>

namespace plotcore
{

std::vector<Rect> compute_grid_layout(const Rect& region, int rows, int cols, const Margins& margins)
{
    std::vector<Rect> rects;
    if (rows <= 0 || cols <= 0)
        return rects;

    rects.reserve(static_cast<size_t>(rows * cols));

    float cell_width  = region.w / static_cast<float>(cols);
    float cell_height = region.h / static_cast<float>(rows);

    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            float cell_x = region.x + static_cast<float>(c) * cell_width;
            float cell_y = region.y + static_cast<float>(r) * cell_height;

            Rect area;
            area.x = cell_x + margins.left;
            area.y = cell_y + margins.top;
            area.w = std::max(0.0f, cell_width - margins.left - margins.right);
            area.h = std::max(0.0f, cell_height - margins.top - margins.bottom);
            rects.push_back(area);
        }
    }

    return rects;
}

}   // namespace plotcore
