#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Grid.hpp"

class Maze
{
public:
    // end defaults to the bottom-right corner
    explicit Maze(int32_t width = 20,
                  int32_t height = 20,
                  Cell start = { 0, 0 },
                  std::optional<Cell> end = std::nullopt);

    int32_t Width() const { return grid_.Width(); }
    int32_t Height() const { return grid_.Height(); }
    const Cell& Start() const { return start_; }
    const Cell& End() const { return end_; }
    uint32_t Seed() const { return seed_; }

    const Grid& GetGrid() const { return grid_; }

private:
    friend class MazeBuilder;

    Grid grid_;
    Cell start_;
    Cell end_;
    uint32_t seed_{};
};

class MazeBuilder
{
public:
    using UpdateFn = std::function<void(const Maze&, const Cell& from, const Cell& to)>;

    // randomized DFS backtracking from maze.Start(); leaves a perfect maze
    static void Build(Maze& maze, uint32_t seed, const UpdateFn& onUpdate = nullptr);

    // same carving on a bare grid
    static void Carve(Grid& grid, const Cell& start, uint32_t seed,
                      const std::function<void(const Cell&, const Cell&)>& onCarve = nullptr);
};
