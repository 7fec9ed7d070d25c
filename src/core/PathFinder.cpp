#include "core/PathFinder.hpp"

#include <queue>

bool PathFinder::FindPath(
    const Grid& grid,
    const Cell& start,
    const Cell& end,
    Path& outPath,
    std::string& outError,
    const StepFn& onStep)
{
    outPath.clear();
    outError.clear();

    BFSExploer bfs(grid, start, end);
    while (bfs.Update())
    {
        if (onStep) onStep(bfs);
    }

    if (!bfs.Found()) {
        outError = bfs.Error();
        return false;
    }

    outPath = PathReconstructor::Reconstruct(bfs.Parent(), end);
    return true;
}

bool PathFinder::FindPath(
    const Maze& maze,
    Path& outPath,
    std::string& outError,
    const StepFn& onStep)
{
    return FindPath(maze.GetGrid(), maze.Start(), maze.End(), outPath, outError, onStep);
}

std::vector<std::vector<int32_t>> PathFinder::Distances(const Grid& grid, const Cell& start)
{
    if (!grid.InBounds(start)) throw OutOfBounds(start);

    std::vector<std::vector<int32_t>> dist(grid.Height(), std::vector<int32_t>(grid.Width(), -1));
    std::queue<Cell> q;

    dist[start.row][start.col] = 0;
    q.push(start);

    while (!q.empty())
    {
        const Cell cur = q.front(); q.pop();

        for (Direction d : kDirections)
        {
            if (!grid.HasPassage(cur, d)) continue;

            const Cell n = Step(cur, d);
            if (dist[n.row][n.col] != -1) continue;

            dist[n.row][n.col] = dist[cur.row][cur.col] + 1;
            q.push(n);
        }
    }

    return dist;
}

Path PathReconstructor::Reconstruct(const ParentMap& parent, const Cell& end)
{
    Path rev;
    std::optional<Cell> cur = end;

    while (cur)
    {
        auto it = parent.find(*cur);
        if (it == parent.end()) {
            throw MissingKey(*cur, "cell " + cur->ToString() + " is not in the parent map");
        }

        rev.push_back(*cur);
        if (rev.size() > parent.size()) {
            throw MissingKey(end, "parent map loops before reaching the start");
        }
        cur = it->second;
    }

    std::reverse(rev.begin(), rev.end());
    return rev;
}

bool PathReconstructor::IsValidPath(const Grid& grid, const Path& path, const Cell& start, const Cell& end)
{
    if (path.empty()) return false;
    if (path.front() != start || path.back() != end) return false;

    for (size_t i = 1; i < path.size(); ++i)
    {
        const Cell& a = path[i - 1];
        if (!grid.InBounds(a) || !grid.InBounds(path[i])) return false;

        bool linked = false;
        for (Direction d : kDirections)
        {
            if (Step(a, d) == path[i]) {
                linked = grid.HasPassage(a, d);
                break;
            }
        }
        if (!linked) return false;
    }
    return true;
}
