#ifndef __SEARCH_TYPES_HPP___
#define __SEARCH_TYPES_HPP___

#include <cstddef>
#include <string>
#include <vector>

#include "state.hpp"

/**
 * @file search_types.hpp
 * @brief Method selector, options, statistics and result of a search run.
 */

/**
 * @brief The closed set of search strategies understood by the engine.
 */
enum class Method {
    AStar,
    Greedy,
    UniformCost,
    BreadthFirst,
    DepthFirst,
    DepthLimited,
    IterativeDeepening
};

/**
 * @brief All methods, in the order used by the benchmark and the help text.
 */
const std::vector<Method>& all_methods();

/**
 * @brief Command-line name of a method ("a*", "greedy", "ucs", "bfs", "dfs", "dls", "ids").
 */
std::string method_name(Method method);

/**
 * @brief Parse a method name, case-insensitive. "astar" is accepted for "a*".
 *
 * @throws std::invalid_argument for an unknown name.
 */
Method parse_method(const std::string& name);

/**
 * @brief Whether the method orders its frontier with the heuristic.
 */
bool uses_heuristic(Method method);

/**
 * @brief Whether the method applies a depth limit (DLS and IDS).
 */
bool is_depth_limited(Method method);

enum class Outcome {
    Solved,
    Exhausted,
    DepthExceeded,
    NodeLimitReached
};

std::string outcome_name(Outcome outcome);

/**
 * @brief Counters of one search invocation.
 *
 * `max_fringe_size` is sampled right before every pop.
 */
struct SearchStats {
    size_t nodes_popped = 0;
    size_t nodes_expanded = 0;
    size_t nodes_generated = 0;
    size_t max_fringe_size = 0;
};

struct SearchOptions {
    Method method = Method::AStar;
    // Required for DLS, ignored otherwise.
    int depth_limit = -1;
    // Largest limit IDS tries before giving up with DepthExceeded.
    int max_depth = 1000;
    // Stop after this many pops, 0 for no budget.
    size_t max_nodes = 0;
    // Report Exhausted without searching when start and goal differ in parity.
    bool parity_check = false;
};

struct SearchResult {
    Method method = Method::AStar;
    Outcome outcome = Outcome::Exhausted;
    std::vector<Move> moves;
    // Root to goal, one more entry than `moves` when solved.
    std::vector<State> states;
    int path_cost = 0;
    int depth = 0;
    SearchStats stats;
    // Limit of the last pass (DLS, IDS), -1 for the other methods.
    int depth_limit = -1;
    // Number of passes over the state space (IDS runs one per limit).
    int iterations = 0;

    bool solved() const { return outcome == Outcome::Solved; }
};

#endif // __SEARCH_TYPES_HPP___
