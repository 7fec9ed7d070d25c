#include "core/Common.hpp"
#include "Exploer/Exploer.hpp"

BFSExploer::BFSExploer(const Grid& grid, const Cell& start, const Cell& end)
    : grid(grid), startPoint(start), endPoint(end), current(start)
{
    if (!grid.InBounds(start)) throw OutOfBounds(start);
    if (!grid.InBounds(end)) throw OutOfBounds(end);

    visited.assign(grid.Height(), std::vector<bool>(grid.Width(), false));
    visited[start.row][start.col] = true;
    parent[start] = std::nullopt;
    q.push(start);
}

bool BFSExploer::Update()
{
    if (state != State::EXPLORE) return false;

    if (q.empty()) {
        state = State::END;
        found = false;
        error = "No path.";
        return false;
    }

    current = q.front();
    q.pop();

    way.push_back(current);
    timeStep += 1;

    if (current == endPoint) {
        found = true;
        state = State::END;
        return true;
    }

    expand_(current);
    return true;
}

void BFSExploer::expand_(const Cell& cur)
{
    for (Direction d : kDirections)
    {
        const Cell n = Step(cur, d);
        if (!grid.InBounds(n)) continue;
        if (visited[n.row][n.col]) continue;
        if (grid.WallPresent(cur, d)) continue;

        visited[n.row][n.col] = true;
        parent[n] = cur;
        q.push(n);
    }
}
