#include <plotcore/grid.hpp>
#include <plotcore/logger.hpp>

namespace plotcore
{

GridModel GridModel::from_numbers(int x_divisions, int y_divisions)
{
    if (x_divisions < 0 || y_divisions < 0)
    {
        PLOTCORE_LOG_WARN("grid",
                          "Rejected grid with negative divisions ({}, {})",
                          x_divisions,
                          y_divisions);
        throw InvalidGridError("grid division counts must be non-negative, got ("
                               + std::to_string(x_divisions) + ", "
                               + std::to_string(y_divisions) + ")");
    }
    PLOTCORE_LOG_DEBUG("grid", "Grid {}x{} divisions", x_divisions, y_divisions);
    return GridModel(x_divisions, y_divisions);
}

}   // namespace plotcore
