#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"
#include "distance.hpp"

using namespace std;

GoalLookup::GoalLookup(const State &goal) : goal_state(goal) {
    for (int pos = 0; pos < NUM_CELLS; ++pos) {
        int tile = goal.at(pos);
        rows[tile] = pos / SIDE_LENGTH;
        columns[tile] = pos % SIDE_LENGTH;
    }
}

int manhattan_distance(const State& state, const GoalLookup& goal, const vector<int>& weights) {
    if (weights.size() != static_cast<size_t>(NUM_CELLS - 1)) {
        throw invalid_argument("Expected " + std::to_string(NUM_CELLS - 1) + " tile weights, got " +
                               std::to_string(weights.size()));
    }
    int distance = 0;
    for (int pos = 0; pos < NUM_CELLS; ++pos) {
        int tile = state.at(pos);
        if (tile == BLANK) continue;
        int steps = abs(pos / SIDE_LENGTH - goal.row_of(tile)) + abs(pos % SIDE_LENGTH - goal.column_of(tile));
        distance += weights[tile - 1] * steps;
    }
    return distance;
}

int weighted_manhattan_distance(const State& state, const GoalLookup& goal) {
    // moving tile t costs t
    static const vector<int> TILE_COSTS = {1, 2, 3, 4, 5, 6, 7, 8};
    return manhattan_distance(state, goal, TILE_COSTS);
}
