#ifndef __8_PUZZLE_SEARCH_ENGINE_HPP___
#define __8_PUZZLE_SEARCH_ENGINE_HPP___

#include <unordered_map>

#include "state.hpp"
#include "distance.hpp"
#include "frontier.hpp"
#include "node_arena.hpp"
#include "search_observer.hpp"
#include "search_types.hpp"

/**
 * @file 8-puzzle-search-engine.hpp
 * @brief One search loop for all seven strategies.
 *
 * The methods differ only in how the frontier is ordered and in when a state
 * counts as already visited:
 *
 * | method | frontier | key     | skip a state when it was visited ... |
 * |--------|----------|---------|--------------------------------------|
 * | a*     | priority | g + h   | with a cost <= g                     |
 * | greedy | priority | h       | at all                               |
 * | ucs    | priority | g       | with a cost <= g                     |
 * | bfs    | fifo     |         | at all                               |
 * | dfs    | lifo     |         | at all                               |
 * | dls    | lifo     |         | at a depth <= d, no expansion at d >= limit |
 * | ids    | lifo     |         | dls with limit 0, 1, 2, ..., fresh map per limit |
 *
 * Equal priority keys pop in insertion order. Successors are pushed in the
 * order `State::get_available_moves` returns them, so DFS pops the last one
 * first.
 */

/**
 * @brief Priority key of a node under `method`.
 *
 * f = g + h for A*, h for Greedy, g for UCS and the depth for the uninformed
 * methods (only reported there, their frontier ignores it).
 */
long frontier_key(Method method, const Node &node);

class PuzzleSearchEngine {
public:
    /**
     * @param observer Optional event sink, must outlive `run()`.
     */
    PuzzleSearchEngine(const State &start, const State &goal, const SearchOptions &options,
                       SearchObserver *observer = nullptr);

    /**
     * @brief Run the search to completion.
     *
     * Failing to find a solution is reported through `SearchResult::outcome`.
     *
     * @throws std::invalid_argument if DLS has no depth limit or the IDS
     *         maximum depth is negative.
     */
    SearchResult run();

private:
    enum class PassEnd {
        Goal,
        Empty,
        NodeLimit
    };

    PassEnd search_pass(int depth_limit, bool restart, NodeHandle &goal_node, bool &cut_off);
    NodeHandle add_to_frontier(NodeHandle node);
    bool already_visited(const State &state, int path_cost, int depth) const;
    void mark_visited(const State &state, int path_cost, int depth);
    SearchResult finish(Outcome outcome, NodeHandle goal_node, int depth_limit, int iterations);

    State start;
    State goal;
    GoalLookup goal_lookup;
    SearchOptions options;
    SearchObserver *observer;

    NodeArena arena;
    Frontier frontier;
    // State -> best cost (a*, ucs) or shallowest depth (dls, ids) it was expanded at.
    std::unordered_map<State, int> closed;
    SearchStats stats;
};

/**
 * @brief Solve the puzzle with the method selected in `options`.
 *
 * @param start Starting puzzle state.
 * @param goal Goal puzzle state.
 * @param options Method and limits.
 * @param observer Optional event sink (trace dump).
 * @return Outcome, path and statistics of the run.
 */
SearchResult PuzzleSolve(const State &start, const State &goal, const SearchOptions &options,
                         SearchObserver *observer = nullptr);

#endif // __8_PUZZLE_SEARCH_ENGINE_HPP___
