#ifndef __DISTANCE_HPP___
#define __DISTANCE_HPP___

#include <array>
#include <vector>

#include "state.hpp"

/**
 * @file distance.hpp
 * @brief Heuristic distance functions for 8-puzzle states.
 */

/**
 * @brief Goal position of every tile, built once per goal.
 */
class GoalLookup {
public:
    explicit GoalLookup(const State &goal);

    int row_of(int tile) const { return rows[tile]; }
    int column_of(int tile) const { return columns[tile]; }
    const State& goal() const { return goal_state; }

private:
    State goal_state;
    std::array<int, NUM_CELLS> rows;
    std::array<int, NUM_CELLS> columns;
};

/**
 * @brief Manhattan distance to the goal with one weight per tile.
 *
 * @param weights `weights[t-1]` multiplies the distance of tile t.
 * @throws std::invalid_argument if there is not exactly one weight per tile.
 */
int manhattan_distance(const State& state, const GoalLookup& goal, const std::vector<int>& weights);

/**
 * @brief Expense heuristic: every tile weighted by its own number.
 *
 * h(state) = sum over tiles t of t * (|row - goal_row| + |col - goal_col|).
 * Moving tile t costs t, so this never overestimates the remaining cost and
 * drops by at most t across a single move.
 */
int weighted_manhattan_distance(const State& state, const GoalLookup& goal);

#endif // __DISTANCE_HPP___
