// Google Test for the weighted Manhattan heuristic
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "state.hpp"
#include "distance.hpp"
#include "test_helpers.hpp"

TEST(Distance, ZeroAtGoal) {
    State goal;
    GoalLookup lookup(goal);
    EXPECT_EQ(weighted_manhattan_distance(goal, lookup), 0);
}

TEST(Distance, TileNumberTimesDistance) {
    State goal;
    GoalLookup lookup(goal);
    // 5 and 6 are one cell away from home each: 5*1 + 6*1
    EXPECT_EQ(weighted_manhattan_distance(State({1, 2, 3, 4, 0, 5, 7, 8, 6}), lookup), 11);
    // 7 and 8 one cell to the right of home
    EXPECT_EQ(weighted_manhattan_distance(State({1, 2, 3, 4, 5, 6, 0, 7, 8}), lookup), 7 + 8);
    // 1 four cells away, 8 three, 5 one
    EXPECT_EQ(weighted_manhattan_distance(State({8, 2, 3, 4, 0, 6, 7, 5, 1}), lookup), 1 * 4 + 8 * 3 + 5 * 1);
}

// The lookup places every tile where the goal has it
TEST(Distance, LookupFollowsGoal) {
    State goal({1, 2, 3, 8, 0, 4, 7, 6, 5});
    GoalLookup lookup(goal);
    for (int tile = 1; tile < NUM_CELLS; ++tile) {
        EXPECT_EQ(lookup.row_of(tile), goal.get_tile_row(tile)) << tile;
        EXPECT_EQ(lookup.column_of(tile), goal.get_tile_column(tile)) << tile;
    }
    EXPECT_EQ(lookup.goal(), goal);
    // 2 and 1 one cell off, 8 two cells, 6 one cell
    EXPECT_EQ(weighted_manhattan_distance(State({2, 8, 3, 1, 6, 4, 7, 0, 5}), lookup), 2 * 1 + 8 * 2 + 1 * 1 + 6 * 1);
}

TEST(Distance, UniformWeightsGivePlainManhattan) {
    GoalLookup lookup(State::canonical_goal());
    std::vector<int> ones(NUM_CELLS - 1, 1);
    EXPECT_EQ(manhattan_distance(State({1, 2, 3, 4, 0, 5, 7, 8, 6}), lookup, ones), 2);
    EXPECT_EQ(manhattan_distance(State({8, 2, 3, 4, 0, 6, 7, 5, 1}), lookup, ones), 4 + 3 + 1);
}

TEST(Distance, WrongWeightCountThrows) {
    GoalLookup lookup(State::canonical_goal());
    EXPECT_THROW(manhattan_distance(State(), lookup, std::vector<int>(3, 1)), std::invalid_argument);
    EXPECT_THROW(manhattan_distance(State(), lookup, std::vector<int>(NUM_CELLS, 1)), std::invalid_argument);
}

// h never exceeds the exact remaining cost, checked on every reachable state
TEST(Distance, AdmissibleOnWholeStateSpace) {
    State goal;
    GoalLookup lookup(goal);
    const auto &costs = canonical_optimal_costs();
    ASSERT_EQ(costs.size(), 181440u);
    for (const auto &entry : costs) {
        ASSERT_LE(weighted_manhattan_distance(entry.first, lookup), entry.second) << entry.first.to_list_string();
    }
}

// h(n) <= cost(n -> n') + h(n') for every legal move
TEST(Distance, ConsistentOnEveryTransition) {
    State goal;
    GoalLookup lookup(goal);
    for (const auto &entry : canonical_optimal_costs()) {
        int h = weighted_manhattan_distance(entry.first, lookup);
        for (const auto &mv : entry.first.get_available_moves()) {
            ASSERT_LE(h, mv.move.cost + weighted_manhattan_distance(mv.state, lookup))
                << entry.first.to_list_string() << " -> " << mv.move.label();
        }
    }
}

// The same holds for a non-canonical goal
TEST(Distance, AdmissibleForOtherGoal) {
    State goal({1, 2, 3, 8, 0, 4, 7, 6, 5});
    GoalLookup lookup(goal);
    auto costs = optimal_costs_to(goal);
    for (const auto &entry : costs) {
        ASSERT_LE(weighted_manhattan_distance(entry.first, lookup), entry.second);
    }
}
