#include "core/Common.hpp"
#include "core/App.hpp"
#include "core/MazeBuilder.hpp"
#include "core/PathFinder.hpp"

#include <chrono>
#include <limits>
#include <sstream>

static bool parseInt(const std::string& s, int64_t& out)
{
    try {
        size_t used = 0;
        out = std::stoll(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static std::string formatPath(const Path& path)
{
    std::ostringstream os;
    for (size_t i = 0; i < path.size(); ++i)
    {
        if (i) os << " -> ";
        os << path[i].ToString();
    }
    return os.str();
}

bool validMazeSize(int64_t width, int64_t height)
{
    return width > 0 && height > 0 && width <= kMaxMazeSide && height <= kMaxMazeSide;
}

bool parseArgs(int argc, char** argv, AppConfig& out, std::string& outError)
{
    std::vector<int64_t> nums;
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "--steps") { out.steps = true; continue; }

        int64_t v = 0;
        if (!parseInt(a, v)) { outError = "not a number: " + a; return false; }
        nums.push_back(v);
    }

    if (nums.size() != 3 && nums.size() != 7) {
        outError = "usage: perfectmaze <width> <height> <seed> [startRow startCol endRow endCol] [--steps]";
        return false;
    }
    if (!validMazeSize(nums[0], nums[1])) {
        outError = "width and height must be in [1, " + std::to_string(kMaxMazeSide) + "]";
        return false;
    }

    out.width = (int32_t)nums[0];
    out.height = (int32_t)nums[1];
    out.seed = (uint32_t)nums[2];

    if (nums.size() == 7) {
        out.start = { (int32_t)nums[3], (int32_t)nums[4] };
        out.end = Cell{ (int32_t)nums[5], (int32_t)nums[6] };

        auto inside = [&](const Cell& c) {
            return c.row >= 0 && c.col >= 0 && c.row < out.height && c.col < out.width;
        };
        if (!inside(out.start) || !inside(*out.end)) {
            outError = "start and end must lie inside the grid";
            return false;
        }
    }
    return true;
}

int runMaze(const AppConfig& cfg)
{
    Maze maze(cfg.width, cfg.height, cfg.start, cfg.end);

    std::cout << "building " << cfg.width << "x" << cfg.height
              << " maze, seed " << cfg.seed << std::endl;

    size_t carved = 0;
    MazeBuilder::Build(maze, cfg.seed, [&](const Maze&, const Cell&, const Cell&) { ++carved; });
    std::cout << "carved " << carved << " passages" << std::endl;

    auto startTime = std::chrono::high_resolution_clock::now();

    Path path;
    std::string error;
    bool ok = false;

    if (cfg.steps)
    {
        BFSExploer bfs(maze.GetGrid(), maze.Start(), maze.End());
        while (bfs.Update())
        {
            std::cout << "step " << bfs.TimeStep() << ": " << bfs.Current().ToString() << std::endl;
        }
        ok = bfs.Found();
        if (ok) path = PathReconstructor::Reconstruct(bfs.Parent(), maze.End());
        else error = bfs.Error();
    }
    else
    {
        ok = PathFinder::FindPath(maze, path, error);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);

    if (!ok) {
        std::cerr << "solve " << maze.Start().ToString() << " -> " << maze.End().ToString()
                  << " failed: " << error << std::endl;
        return 1;
    }

    std::cout << "path length " << path.size() - 1 << " (" << duration.count() << " us)" << std::endl;
    std::cout << formatPath(path) << std::endl;
    return 0;
}

void runApp()
{
    while (true) {
        std::string input;
        std::cout << "press b to build a maze" << std::endl;
        std::cout << "press q to quit" << std::endl;
        if (!(std::cin >> input)) break;

        if (input == "b") {
            AppConfig cfg;
            std::cout << "Enter seed value: ";
            std::cin >> cfg.seed;
            std::cout << "Enter width and height: ";
            std::cin >> cfg.width >> cfg.height;
            if (!std::cin || !validMazeSize(cfg.width, cfg.height)) {
                std::cout << "Invalid maze size." << std::endl;
                std::cin.clear();
                std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                continue;
            }
            runMaze(cfg);
        } else if (input == "q") {
            break;
        } else {
            std::cout << "Invalid input. Please try again." << std::endl;
        }
    }
}
