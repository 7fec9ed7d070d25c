#include <gtest/gtest.h>

#include "core/App.hpp"

#include <iostream>
#include <sstream>

namespace {

bool Parse(std::vector<std::string> args, AppConfig& cfg, std::string& error)
{
    args.insert(args.begin(), "perfectmaze");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parseArgs((int)argv.size(), argv.data(), cfg, error);
}

}

TEST(AppTest, ParsesSizeAndSeed)
{
    AppConfig cfg;
    std::string error;
    ASSERT_TRUE(Parse({ "12", "8", "77" }, cfg, error)) << error;
    EXPECT_EQ(cfg.width, 12);
    EXPECT_EQ(cfg.height, 8);
    EXPECT_EQ(cfg.seed, 77u);
    EXPECT_EQ(cfg.start, (Cell{ 0, 0 }));
    EXPECT_FALSE(cfg.end.has_value());
    EXPECT_FALSE(cfg.steps);
}

TEST(AppTest, ParsesEndpointsAndSteps)
{
    AppConfig cfg;
    std::string error;
    ASSERT_TRUE(Parse({ "5", "4", "1", "1", "2", "3", "4", "--steps" }, cfg, error)) << error;
    EXPECT_EQ(cfg.start, (Cell{ 1, 2 }));
    ASSERT_TRUE(cfg.end.has_value());
    EXPECT_EQ(*cfg.end, (Cell{ 3, 4 }));
    EXPECT_TRUE(cfg.steps);
}

TEST(AppTest, RejectsBadInput)
{
    AppConfig cfg;
    std::string error;
    EXPECT_FALSE(Parse({ "5", "4" }, cfg, error));
    EXPECT_FALSE(Parse({ "5", "x", "1" }, cfg, error));
    EXPECT_EQ(error, "not a number: x");
    EXPECT_FALSE(Parse({ "0", "4", "1" }, cfg, error));
    EXPECT_FALSE(Parse({ "5", "4", "1", "0", "0", "4", "4" }, cfg, error));
    EXPECT_EQ(error, "start and end must lie inside the grid");
}

TEST(AppTest, MazeSizeLimits)
{
    EXPECT_TRUE(validMazeSize(1, 1));
    EXPECT_TRUE(validMazeSize(kMaxMazeSide, kMaxMazeSide));
    EXPECT_FALSE(validMazeSize(0, 5));
    EXPECT_FALSE(validMazeSize(5, -1));
    EXPECT_FALSE(validMazeSize(kMaxMazeSide + 1, 5));
    EXPECT_FALSE(validMazeSize(5, 2'000'000'000));

    AppConfig cfg;
    std::string error;
    EXPECT_FALSE(Parse({ "10001", "4", "1" }, cfg, error));
    EXPECT_EQ(error, "width and height must be in [1, 10000]");
}

TEST(AppTest, InteractiveLoopRejectsOversizedMaze)
{
    std::istringstream in("b\n7\n50000 3\nq\n");
    std::streambuf* saved = std::cin.rdbuf(in.rdbuf());

    testing::internal::CaptureStdout();
    runApp();
    const std::string out = testing::internal::GetCapturedStdout();
    std::cin.rdbuf(saved);

    EXPECT_NE(out.find("Invalid maze size."), std::string::npos);
    EXPECT_EQ(out.find("building"), std::string::npos);
}

TEST(AppTest, RunMazeSolvesAndReportsSuccess)
{
    AppConfig cfg;
    cfg.width = 6;
    cfg.height = 5;
    cfg.seed = 9;

    testing::internal::CaptureStdout();
    const int rc = runMaze(cfg);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0);
    EXPECT_NE(out.find("carved 29 passages"), std::string::npos);
    EXPECT_NE(out.find("path length"), std::string::npos);
}
