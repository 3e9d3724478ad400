#ifndef __SEARCH_OBSERVER_HPP___
#define __SEARCH_OBSERVER_HPP___

#include <cstddef>
#include <vector>

#include "node_arena.hpp"
#include "search_types.hpp"

/**
 * @file search_observer.hpp
 * @brief Event stream emitted by the search engine.
 *
 * Frontier snapshots are only built when an observer is attached, a run
 * without one pays nothing for this interface.
 */
class SearchObserver {
public:
    virtual ~SearchObserver() = default;

    /**
     * @brief A pass starts: the root is on the frontier, nothing popped yet.
     *
     * Called once per run, except for IDS which starts one pass per limit.
     *
     * @param depth_limit Limit of this pass, -1 when the method has none.
     */
    virtual void on_pass_start(Method method, int depth_limit, const State &start, const State &goal,
                               const NodeArena &arena, const std::vector<NodeHandle> &fringe,
                               const SearchStats &stats) = 0;

    /**
     * @brief A node was expanded and its surviving successors pushed.
     *
     * @param successors_generated Successors produced before visited filtering.
     * @param closed_count Number of states in the visited map.
     */
    virtual void on_expand(const NodeArena &arena, NodeHandle expanded, int successors_generated,
                           const std::vector<NodeHandle> &fringe, size_t closed_count,
                           const SearchStats &stats) = 0;

    virtual void on_finish(const SearchResult &result) = 0;
};

#endif // __SEARCH_OBSERVER_HPP___
