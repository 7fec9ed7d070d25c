#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

// up, right, down, left; true = wall
using CellWalls = std::array<bool, 4>;

class Grid
{
public:
    Grid(int32_t width, int32_t height);

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }

    bool InBounds(const Cell& c) const
    {
        return c.row >= 0 && c.col >= 0 && c.row < height_ && c.col < width_;
    }

    // throws OutOfBounds
    bool WallPresent(const Cell& c, Direction d) const;
    const CellWalls& Walls(const Cell& c) const;

    // clears both halves of the edge between c and Step(c, d)
    void RemoveWall(const Cell& c, Direction d);

    // neighbour exists and no wall in between
    bool HasPassage(const Cell& c, Direction d) const;

    bool FullyWalled() const;
    size_t OpenPassageCount() const;

private:
    int32_t width_;
    int32_t height_;
    std::vector<std::vector<CellWalls>> cells_;
};
