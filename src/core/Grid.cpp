#include "core/Grid.hpp"

Grid::Grid(int32_t width, int32_t height)
    : width_(width), height_(height)
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("grid size must be positive, got "
            + std::to_string(width) + "x" + std::to_string(height));
    }
    cells_.assign(height, std::vector<CellWalls>(width, CellWalls{ true, true, true, true }));
}

bool Grid::WallPresent(const Cell& c, Direction d) const
{
    return Walls(c)[(size_t)d];
}

const CellWalls& Grid::Walls(const Cell& c) const
{
    if (!InBounds(c)) throw OutOfBounds(c);
    return cells_[c.row][c.col];
}

void Grid::RemoveWall(const Cell& c, Direction d)
{
    if (!InBounds(c)) throw OutOfBounds(c);
    const Cell n = Step(c, d);
    if (!InBounds(n)) throw OutOfBounds(n);

    cells_[c.row][c.col][(size_t)d] = false;
    cells_[n.row][n.col][(size_t)Opposite(d)] = false;
}

bool Grid::HasPassage(const Cell& c, Direction d) const
{
    if (!InBounds(c)) throw OutOfBounds(c);
    if (!InBounds(Step(c, d))) return false;
    return !WallPresent(c, d);
}

bool Grid::FullyWalled() const
{
    for (const auto& row : cells_)
        for (const auto& w : row)
            if (!(w[0] && w[1] && w[2] && w[3])) return false;
    return true;
}

size_t Grid::OpenPassageCount() const
{
    // right and down only, so every edge is seen once
    size_t open = 0;
    for (int32_t r = 0; r < height_; ++r)
    {
        for (int32_t c = 0; c < width_; ++c)
        {
            if (HasPassage({ r, c }, Direction::Right)) ++open;
            if (HasPassage({ r, c }, Direction::Down)) ++open;
        }
    }
    return open;
}
