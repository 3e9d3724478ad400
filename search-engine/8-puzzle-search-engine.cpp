#include <algorithm>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "8-puzzle-search-engine.hpp"

using namespace std;

static Frontier::Discipline discipline_for(Method method) {
    switch (method) {
        case Method::AStar:
        case Method::Greedy:
        case Method::UniformCost:
            return Frontier::Discipline::Priority;
        case Method::BreadthFirst:
            return Frontier::Discipline::Fifo;
        case Method::DepthFirst:
        case Method::DepthLimited:
        case Method::IterativeDeepening:
            return Frontier::Discipline::Lifo;
    }
    throw invalid_argument("Unknown method");
}

long frontier_key(Method method, const Node &node) {
    switch (method) {
        case Method::AStar:
            return node.path_cost + node.heuristic.value_or(0);
        case Method::Greedy:
            return node.heuristic.value_or(0);
        case Method::UniformCost:
            return node.path_cost;
        default:
            return node.depth;
    }
}

PuzzleSearchEngine::PuzzleSearchEngine(const State &start, const State &goal, const SearchOptions &options,
                                       SearchObserver *observer)
    : start(start),
      goal(goal),
      goal_lookup(goal),
      options(options),
      observer(observer),
      frontier(discipline_for(options.method))
{
}

NodeHandle PuzzleSearchEngine::add_to_frontier(NodeHandle node) {
    if (uses_heuristic(options.method)) {
        arena[node].heuristic = weighted_manhattan_distance(arena[node].state, goal_lookup);
    }
    frontier.push(node, frontier_key(options.method, arena[node]));
    return node;
}

bool PuzzleSearchEngine::already_visited(const State &state, int path_cost, int depth) const {
    auto it = closed.find(state);
    if (it == closed.end()) return false;
    switch (options.method) {
        case Method::AStar:
        case Method::UniformCost:
            return it->second <= path_cost;
        case Method::DepthLimited:
        case Method::IterativeDeepening:
            return it->second <= depth;
        default:
            return true;
    }
}

void PuzzleSearchEngine::mark_visited(const State &state, int path_cost, int depth) {
    switch (options.method) {
        case Method::AStar:
        case Method::UniformCost:
            closed[state] = path_cost;
            break;
        case Method::DepthLimited:
        case Method::IterativeDeepening:
            closed[state] = depth;
            break;
        default:
            closed[state] = 0;
            break;
    }
}

PuzzleSearchEngine::PassEnd PuzzleSearchEngine::search_pass(int depth_limit, bool restart, NodeHandle &goal_node,
                                                             bool &cut_off) {
    arena.clear();
    frontier.clear();
    closed.clear();
    cut_off = false;

    // IDS rebuilds its root on every restart, which counts as generating it again
    if (restart) ++stats.nodes_generated;
    add_to_frontier(arena.add_root(start));
    if (observer) {
        observer->on_pass_start(options.method, depth_limit, start, goal, arena, frontier.snapshot(), stats);
    }

    while (!frontier.empty()) {
        if (options.max_nodes > 0 && stats.nodes_popped >= options.max_nodes) {
            return PassEnd::NodeLimit;
        }
        stats.max_fringe_size = max(stats.max_fringe_size, frontier.size());
        NodeHandle current = frontier.pop();
        ++stats.nodes_popped;

        // copied out: the arena may reallocate while successors are added
        const State state = arena[current].state;
        const int path_cost = arena[current].path_cost;
        const int depth = arena[current].depth;

        if (state == goal) {
            goal_node = current;
            return PassEnd::Goal;
        }
        if (already_visited(state, path_cost, depth)) {
            continue;
        }
        if (depth_limit >= 0 && depth >= depth_limit) {
            cut_off = true;
            continue;
        }

        mark_visited(state, path_cost, depth);
        int generated = 0;
        for (const Successor &succ : state.get_available_moves()) {
            ++generated;
            ++stats.nodes_generated;
            if (already_visited(succ.state, path_cost + succ.move.cost, depth + 1)) {
                continue;
            }
            add_to_frontier(arena.add_child(current, succ.state, succ.move));
        }
        ++stats.nodes_expanded;

        if (observer) {
            observer->on_expand(arena, current, generated, frontier.snapshot(), closed.size(), stats);
        }
    }
    return PassEnd::Empty;
}

SearchResult PuzzleSearchEngine::finish(Outcome outcome, NodeHandle goal_node, int depth_limit, int iterations) {
    SearchResult result;
    result.method = options.method;
    result.outcome = outcome;
    result.stats = stats;
    result.depth_limit = depth_limit;
    result.iterations = iterations;
    if (outcome == Outcome::Solved) {
        for (NodeHandle h : arena.path_to(goal_node)) {
            const Node &node = arena[h];
            result.states.push_back(node.state);
            if (node.move) result.moves.push_back(*node.move);
        }
        result.path_cost = arena[goal_node].path_cost;
        result.depth = arena[goal_node].depth;
    }
    spdlog::debug("{}: {} after {} pops, {} expansions, {} generated, max fringe {}", method_name(options.method),
                  outcome_name(outcome), stats.nodes_popped, stats.nodes_expanded, stats.nodes_generated,
                  stats.max_fringe_size);
    if (observer) {
        observer->on_finish(result);
    }
    return result;
}

SearchResult PuzzleSearchEngine::run() {
    stats = SearchStats();
    if (options.method == Method::DepthLimited && options.depth_limit < 0) {
        throw invalid_argument("dls requires a non-negative depth limit");
    }
    if (options.method == Method::IterativeDeepening && options.max_depth < 0) {
        throw invalid_argument("ids requires a non-negative maximum depth");
    }

    if (options.parity_check && !is_reachable(start, goal)) {
        spdlog::debug("{}: start and goal differ in parity, skipping search", method_name(options.method));
        return finish(Outcome::Exhausted, NO_PARENT, -1, 0);
    }

    NodeHandle goal_node = NO_PARENT;
    bool cut_off = false;

    if (options.method == Method::IterativeDeepening) {
        int iterations = 0;
        for (int limit = 0; limit <= options.max_depth; ++limit) {
            ++iterations;
            PassEnd end = search_pass(limit, limit > 0, goal_node, cut_off);
            spdlog::debug("ids: limit {} done, {} pops so far", limit, stats.nodes_popped);
            if (end == PassEnd::Goal) {
                return finish(Outcome::Solved, goal_node, limit, iterations);
            }
            if (end == PassEnd::NodeLimit) {
                return finish(Outcome::NodeLimitReached, NO_PARENT, limit, iterations);
            }
            if (!cut_off) {
                // nothing was pruned, a deeper limit cannot find more states
                return finish(Outcome::Exhausted, NO_PARENT, limit, iterations);
            }
        }
        return finish(Outcome::DepthExceeded, NO_PARENT, options.max_depth, iterations);
    }

    int limit = options.method == Method::DepthLimited ? options.depth_limit : -1;
    PassEnd end = search_pass(limit, false, goal_node, cut_off);
    switch (end) {
        case PassEnd::Goal:
            return finish(Outcome::Solved, goal_node, limit, 1);
        case PassEnd::NodeLimit:
            return finish(Outcome::NodeLimitReached, NO_PARENT, limit, 1);
        case PassEnd::Empty:
        default:
            return finish(cut_off ? Outcome::DepthExceeded : Outcome::Exhausted, NO_PARENT, limit, 1);
    }
}

SearchResult PuzzleSolve(const State &start, const State &goal, const SearchOptions &options,
                         SearchObserver *observer) {
    PuzzleSearchEngine engine(start, goal, options, observer);
    return engine.run();
}
