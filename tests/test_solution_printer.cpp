// Google Test for the solver's stdout report
#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "state.hpp"
#include "search_types.hpp"
#include "8-puzzle-search-engine.hpp"
#include "solution_printer.hpp"

static SearchResult with_stats(Outcome outcome) {
    SearchResult r;
    r.outcome = outcome;
    r.stats.nodes_popped = 3;
    r.stats.nodes_expanded = 2;
    r.stats.nodes_generated = 7;
    r.stats.max_fringe_size = 5;
    return r;
}

static std::string printed(const SearchResult& r) {
    std::ostringstream out;
    print_result(out, r);
    return out.str();
}

static const std::string COUNTERS =
    "Nodes Popped: 3\n"
    "Nodes Expanded: 2\n"
    "Nodes Generated: 7\n"
    "Max Fringe Size: 5\n";

TEST(SolutionPrinter, Solved) {
    SearchResult r = with_stats(Outcome::Solved);
    r.moves = {Move{5, Direction::Left, 5}, Move{6, Direction::Up, 6}};
    r.depth = 2;
    r.path_cost = 11;
    EXPECT_EQ(printed(r), COUNTERS +
                              "Solution Found at depth 2 with cost of 11.\n"
                              "Steps:\n"
                              "        Move 5 Left\n"
                              "        Move 6 Up\n");
}

TEST(SolutionPrinter, SolvedAtStart) {
    SearchResult r = with_stats(Outcome::Solved);
    EXPECT_EQ(printed(r), COUNTERS + "Solution Found at depth 0 with cost of 0.\nSteps:\n");
}

TEST(SolutionPrinter, DepthExceeded) {
    SearchResult r = with_stats(Outcome::DepthExceeded);
    r.depth_limit = 1;
    EXPECT_EQ(printed(r), COUNTERS + "No solution found within depth limit 1.\n");
}

TEST(SolutionPrinter, NodeLimitReached) {
    EXPECT_EQ(printed(with_stats(Outcome::NodeLimitReached)), COUNTERS + "No solution found within the node budget.\n");
}

TEST(SolutionPrinter, Exhausted) {
    EXPECT_EQ(printed(with_stats(Outcome::Exhausted)), COUNTERS + "No solution found.\n");
}

// The report of a real A* run matches its result
TEST(SolutionPrinter, ReportOfSearchRun) {
    SearchResult r = PuzzleSolve(State({1, 2, 3, 4, 0, 5, 7, 8, 6}), State::canonical_goal(), SearchOptions());
    EXPECT_EQ(printed(r), "Nodes Popped: 3\n"
                          "Nodes Expanded: 2\n"
                          "Nodes Generated: 7\n"
                          "Max Fringe Size: 5\n"
                          "Solution Found at depth 2 with cost of 11.\n"
                          "Steps:\n"
                          "        Move 5 Left\n"
                          "        Move 6 Up\n");
}
