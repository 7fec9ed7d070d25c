#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

struct AppConfig
{
    int32_t width = 20;
    int32_t height = 20;
    uint32_t seed = 0;
    Cell start{ 0, 0 };
    std::optional<Cell> end;
    bool steps = false;
};

constexpr int64_t kMaxMazeSide = 10'000;

// both sides in [1, kMaxMazeSide]
bool validMazeSize(int64_t width, int64_t height);

// perfectmaze <width> <height> <seed> [sr sc er ec] [--steps]
bool parseArgs(int argc, char** argv, AppConfig& out, std::string& outError);

// builds and solves one maze, logging to stdout; returns the exit code
int runMaze(const AppConfig& cfg);

// interactive loop on std::cin
void runApp();
