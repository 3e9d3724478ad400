// Google Test for the search trace dump
#include <gtest/gtest.h>
#include <chrono>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

#include "state.hpp"
#include "8-puzzle-search-engine.hpp"
#include "trace_writer.hpp"

static size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) ++count;
    return count;
}

static const State START({1, 2, 3, 4, 0, 5, 7, 8, 6});

TEST(TraceWriter, AStarTrace) {
    std::ostringstream out;
    TraceWriter trace(out, {"start.txt", "goal.txt", "a*", "--dump"});
    SearchOptions options;
    options.method = Method::AStar;
    SearchResult r = PuzzleSolve(START, State::canonical_goal(), options, &trace);
    ASSERT_TRUE(r.solved());

    std::string text = out.str();
    EXPECT_EQ(text.find("Command-Line Arguments: [start.txt, goal.txt, a*, --dump]\n"), 0u);
    EXPECT_NE(text.find("After Initialization\n"), std::string::npos);
    EXPECT_NE(text.find("Running a*\n"), std::string::npos);
    EXPECT_NE(text.find("Generating successors to < state = [[1, 2, 3], [4, 0, 5], [7, 8, 6]], action = {Start} "
                        "g(n) = 0, d = 0, h(n) = 11, f(n) = 11, Parent = Pointer to {None} >:\n"),
              std::string::npos);
    EXPECT_NE(text.find("\t4 successors generated\n"), std::string::npos);
    EXPECT_NE(text.find("action = {Move 5 Left} g(n) = 5, d = 1, h(n) = 6, f(n) = 11"), std::string::npos);
    EXPECT_EQ(count_occurrences(text, "Generating successors to"), r.stats.nodes_expanded);
    EXPECT_NE(text.find("Result: solved\n"), std::string::npos);
    EXPECT_NE(text.find("\t\tMove 6 Up\n"), std::string::npos);
}

TEST(TraceWriter, FormatNodeOfUninformedMethod) {
    NodeArena arena;
    NodeHandle root = arena.add_root(START);
    auto succ = START.get_available_moves()[0];
    NodeHandle child = arena.add_child(root, succ.state, succ.move);
    std::string text = TraceWriter::format_node(arena, child, Method::BreadthFirst);
    EXPECT_EQ(text, "< state = [[1, 0, 3], [4, 2, 5], [7, 8, 6]], action = {Move 2 Down} g(n) = 2, d = 1, "
                    "f(n) = 1, Parent = Pointer to {[[1, 2, 3], [4, 0, 5], [7, 8, 6]]} >");
}

TEST(TraceWriter, IterativeDeepeningLabelsEveryPass) {
    std::ostringstream out;
    TraceWriter trace(out, {"s", "g", "ids"});
    SearchOptions options;
    options.method = Method::IterativeDeepening;
    SearchResult r = PuzzleSolve(START, State::canonical_goal(), options, &trace);
    ASSERT_TRUE(r.solved());

    std::string text = out.str();
    EXPECT_NE(text.find("Running ids(limit=0)\n"), std::string::npos);
    EXPECT_NE(text.find("Running ids(limit=1)\n"), std::string::npos);
    EXPECT_NE(text.find("Running ids(limit=2)\n"), std::string::npos);
    EXPECT_EQ(text.find("Running ids(limit=3)"), std::string::npos);
    EXPECT_EQ(count_occurrences(text, "Command-Line Arguments"), 1u);
    EXPECT_EQ(count_occurrences(text, "After Initialization"), 3u);
}

TEST(TraceWriter, FailureIsRecorded) {
    std::ostringstream out;
    TraceWriter trace(out, {});
    SearchOptions options;
    options.method = Method::DepthLimited;
    options.depth_limit = 1;
    PuzzleSolve(START, State::canonical_goal(), options, &trace);
    EXPECT_NE(out.str().find("Running dls(limit=1)\n"), std::string::npos);
    EXPECT_NE(out.str().find("Result: depth-exceeded\n"), std::string::npos);
}

TEST(TraceWriter, FileNameFromTimestamp) {
    std::tm when{};
    when.tm_year = 2024 - 1900;
    when.tm_mon = 2;
    when.tm_mday = 5;
    when.tm_hour = 7;
    when.tm_min = 8;
    when.tm_sec = 9;
    when.tm_isdst = -1;
    auto tp = std::chrono::system_clock::from_time_t(std::mktime(&when));
    EXPECT_EQ(trace_file_name(tp), "trace-2024-03-05-07-08-09.txt");
}
