#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Grid.hpp"

#include <queue>

enum class State
{
    EXPLORE,
    END
};

// Resumable breadth-first search. Each Update() pops one cell from the
// frontier and expands it; the popped cell together with Visited() and
// Parent() is the snapshot handed back to the caller. The explorer stops
// as soon as the end cell is popped and never expands it.
class BFSExploer
{
public:
    BFSExploer(const Grid& grid, const Cell& start, const Cell& end);
    // the explorer keeps a reference to the grid
    BFSExploer(Grid&&, const Cell&, const Cell&) = delete;

    // false once there is nothing left to pop
    bool Update();

    State GetState() const { return state; }
    bool Found() const { return found; }
    const std::string& Error() const { return error; }

    const Cell& Start() const { return startPoint; }
    const Cell& End() const { return endPoint; }

    // last popped cell; only meaningful after the first successful Update()
    const Cell& Current() const { return current; }
    const VisitedMatrix& Visited() const { return visited; }
    const ParentMap& Parent() const { return parent; }
    const std::vector<Cell>& Way() const { return way; }
    uint32_t TimeStep() const { return timeStep; }

private:
    void expand_(const Cell& cur);

    const Grid& grid;
    Cell startPoint;
    Cell endPoint;

    State state{State::EXPLORE};
    bool found{false};
    std::string error;
    uint32_t timeStep{0};

    Cell current{};
    std::queue<Cell> q;
    VisitedMatrix visited;
    ParentMap parent;
    std::vector<Cell> way;
};
