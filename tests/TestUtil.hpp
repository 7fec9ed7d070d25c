#pragma once
#include "core/Grid.hpp"

// wall(A, d) == wall(Step(A, d), Opposite(d)) for every interior edge
inline bool WallsSymmetric(const Grid& grid)
{
    for (int32_t r = 0; r < grid.Height(); ++r)
    {
        for (int32_t c = 0; c < grid.Width(); ++c)
        {
            for (Direction d : kDirections)
            {
                const Cell n = Step({ r, c }, d);
                if (!grid.InBounds(n)) continue;
                if (grid.WallPresent({ r, c }, d) != grid.WallPresent(n, Opposite(d))) return false;
            }
        }
    }
    return true;
}

inline std::vector<CellWalls> Snapshot(const Grid& grid)
{
    std::vector<CellWalls> out;
    for (int32_t r = 0; r < grid.Height(); ++r)
        for (int32_t c = 0; c < grid.Width(); ++c)
            out.push_back(grid.Walls({ r, c }));
    return out;
}
