#ifndef __NODE_ARENA_HPP___
#define __NODE_ARENA_HPP___

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

#include "state.hpp"

/**
 * @file node_arena.hpp
 * @brief Search tree nodes stored in a flat arena and addressed by index.
 *
 * Parent links are indices into the same arena, so walking a path back to
 * the root never depends on the lifetime of individual nodes.
 */

typedef size_t NodeHandle;

constexpr NodeHandle NO_PARENT = std::numeric_limits<NodeHandle>::max();

struct Node {
    State state;
    NodeHandle parent;
    // Empty for the root.
    std::optional<Move> move;
    // g(n): sum of the move costs from the root.
    int path_cost;
    // Number of moves from the root.
    int depth;
    // h(n), only filled in by the methods that use the heuristic.
    std::optional<int> heuristic;
};

class NodeArena {
public:
    NodeArena() = default;

    /**
     * @brief Create the root node of a search tree.
     */
    NodeHandle add_root(const State &state);

    /**
     * @brief Create a child of `parent` reached with `move`.
     *
     * Cost and depth are derived from the parent.
     */
    NodeHandle add_child(NodeHandle parent, const State &state, const Move &move);

    const Node& operator[](NodeHandle handle) const { return nodes[handle]; }
    Node& operator[](NodeHandle handle) { return nodes[handle]; }

    size_t size() const { return nodes.size(); }

    /**
     * @brief Handles from the root down to `handle`, both included.
     */
    std::vector<NodeHandle> path_to(NodeHandle handle) const;

    void clear() { nodes.clear(); }

private:
    std::vector<Node> nodes;
};

#endif // __NODE_ARENA_HPP___
