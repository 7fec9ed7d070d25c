#include "core/MazeBuilder.hpp"
#include <random>

Maze::Maze(int32_t width, int32_t height, Cell start, std::optional<Cell> end)
    : grid_(width, height),
      start_(start),
      end_(end.value_or(Cell{ height - 1, width - 1 }))
{
}

void MazeBuilder::Build(Maze& maze, uint32_t seed, const UpdateFn& onUpdate)
{
    std::function<void(const Cell&, const Cell&)> onCarve;
    if (onUpdate) {
        onCarve = [&](const Cell& from, const Cell& to) { onUpdate(maze, from, to); };
    }
    Carve(maze.grid_, maze.start_, seed, onCarve);
    maze.seed_ = seed;
}

void MazeBuilder::Carve(Grid& grid, const Cell& start, uint32_t seed,
                        const std::function<void(const Cell&, const Cell&)>& onCarve)
{
    if (!grid.InBounds(start)) throw OutOfBounds(start);
    if (!grid.FullyWalled()) throw std::logic_error("maze grid has already been carved");

    std::mt19937 rng(seed);

    VisitedMatrix visited(grid.Height(), std::vector<bool>(grid.Width(), false));
    visited[start.row][start.col] = true;

    std::vector<Cell> st;
    st.push_back(start);

    std::vector<Direction> open;
    open.reserve(4);

    while (!st.empty())
    {
        const Cell cur = st.back();

        open.clear();
        for (Direction d : kDirections)
        {
            const Cell n = Step(cur, d);
            if (!grid.InBounds(n)) continue;
            if (visited[n.row][n.col]) continue;
            open.push_back(d);
        }

        if (open.empty())
        {
            st.pop_back();
            continue;
        }

        // plain modulo keeps layouts identical across standard libraries
        const Direction d = open[rng() % open.size()];
        const Cell next = Step(cur, d);

        grid.RemoveWall(cur, d);
        visited[next.row][next.col] = true;
        st.push_back(next);

        if (onCarve) onCarve(cur, next);
    }
}
