#ifndef __GENERATE_SAMPLE_STATE_HPP___
#define __GENERATE_SAMPLE_STATE_HPP___

#include "state.hpp"
#include <random>
#include <queue>
#include <unordered_set>
#include <vector>

/**
 * @file generate_sample_state.hpp
 * @brief Start states for benchmark runs and tests, drawn near a goal.
 *
 * `random_state_random_walk` scrambles the goal with legal moves,
 * `random_state_bfs` picks uniformly among states at an exact move distance.
 * Results always share the goal's parity, so every sample is solvable.
 */

/**
 * @brief Generate a state by performing a random walk from `goal`.
 *
 * The walk never immediately undoes its previous move, so the result is
 * usually (not always) `target_depth` moves away from the goal.
 *
 * @param goal State the walk starts from.
 * @param target_depth Number of moves in the walk.
 * @param rng Seeded generator, so benchmark instances are reproducible.
 */
inline State random_state_random_walk(const State &goal, int target_depth, std::mt19937 &rng) {
    State scrambled = goal;
    State previous = goal;
    for (int step = 0; step < target_depth; ++step) {
        std::vector<State> options;
        for (const Successor &succ : scrambled.get_available_moves()) {
            if (step > 0 && succ.state == previous) continue;
            options.push_back(succ.state);
        }
        std::uniform_int_distribution<size_t> pick(0, options.size() - 1);
        previous = scrambled;
        scrambled = options[pick(rng)];
    }
    return scrambled;
}

/**
 * @brief Generate a state by uniform sampling among states at exact BFS depth.
 *
 * Performs a breadth-first search from `goal` up to `target_depth` (in
 * moves, not cost) and uniformly selects one of the states at that depth.
 *
 * @param goal Root of the breadth-first search.
 * @param target_depth Depth to sample at (move distance from `goal`).
 * @param rng Seeded generator.
 * @return The sampled state, or `goal` when nothing lies that far away.
 */
inline State random_state_bfs(const State &goal, int target_depth, std::mt19937 &rng) {
    std::queue<std::pair<State, int>> layer_queue;
    std::unordered_set<State> seen{goal};
    layer_queue.push({goal, 0});

    std::vector<State> at_depth;
    while (!layer_queue.empty()) {
        std::pair<State, int> entry = layer_queue.front();
        layer_queue.pop();
        if (entry.second == target_depth) {
            at_depth.push_back(entry.first);
            continue;
        }
        for (const Successor &succ : entry.first.get_available_moves()) {
            if (seen.insert(succ.state).second) {
                layer_queue.push({succ.state, entry.second + 1});
            }
        }
    }

    if (at_depth.empty()) {
        return goal;
    }
    std::uniform_int_distribution<size_t> pick(0, at_depth.size() - 1);
    return at_depth[pick(rng)];
}

#endif // __GENERATE_SAMPLE_STATE_HPP___
