#pragma once
#include "core/Common.hpp"

struct Cell
{
    int32_t row;
    int32_t col;

    bool operator==(const Cell& other) const
    {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Cell& other) const
    {
        return !(*this == other);
    }

    bool operator<(const Cell& other) const
    {
        return row != other.row ? row < other.row : col < other.col;
    }

    std::string ToString() const
    {
        return "(" + std::to_string(row) + ", " + std::to_string(col) + ")";
    }
};

struct CellHash
{
    size_t operator()(const Cell& c) const noexcept
    {
        return std::hash<uint64_t>{}(((uint64_t)(uint32_t)c.row << 32) | (uint32_t)c.col);
    }
};

// cyclic order, index == wall slot
enum class Direction : uint8_t
{
    Up = 0,
    Right = 1,
    Down = 2,
    Left = 3
};

constexpr std::array<Direction, 4> kDirections = {
    Direction::Up, Direction::Right, Direction::Down, Direction::Left
};

inline Direction Opposite(Direction d)
{
    return (Direction)(((int)d + 2) % 4);
}

// neighbour one step away, not bounds-checked
inline Cell Step(const Cell& c, Direction d)
{
    const int dr[4] = { -1, 0, 1, 0 };
    const int dc[4] = { 0, 1, 0, -1 };
    return { c.row + dr[(int)d], c.col + dc[(int)d] };
}

class OutOfBounds : public std::out_of_range
{
public:
    explicit OutOfBounds(const Cell& c)
        : std::out_of_range("cell " + c.ToString() + " is outside the grid"), cell(c) {}

    Cell cell;
};

class MissingKey : public std::runtime_error
{
public:
    MissingKey(const Cell& c, const std::string& what)
        : std::runtime_error(what), cell(c) {}

    Cell cell;
};

using VisitedMatrix = std::vector<std::vector<bool>>;

// empty optional marks the search origin
using ParentMap = std::unordered_map<Cell, std::optional<Cell>, CellHash>;

using Path = std::vector<Cell>;
