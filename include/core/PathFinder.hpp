#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"
#include "core/MazeBuilder.hpp"
#include "Exploer/Exploer.hpp"

class PathFinder
{
public:
    using StepFn = std::function<void(const BFSExploer&)>;

    // Breadth-first shortest path. Returns false and sets outError when the
    // end cannot be reached; onStep sees the explorer after every pop.
    static bool FindPath(
        const Grid& grid,
        const Cell& start,
        const Cell& end,
        Path& outPath,
        std::string& outError,
        const StepFn& onStep = nullptr
    );

    static bool FindPath(
        const Maze& maze,
        Path& outPath,
        std::string& outError,
        const StepFn& onStep = nullptr
    );

    // edge distance from start to every cell, -1 when unreachable
    static std::vector<std::vector<int32_t>> Distances(const Grid& grid, const Cell& start);
};

class PathReconstructor
{
public:
    // throws MissingKey when end was never reached
    static Path Reconstruct(const ParentMap& parent, const Cell& end);

    static bool IsValidPath(const Grid& grid, const Path& path, const Cell& start, const Cell& end);
};
