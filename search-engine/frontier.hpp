#ifndef __FRONTIER_HPP___
#define __FRONTIER_HPP___

#include <cstdint>
#include <deque>
#include <vector>

#include "node_arena.hpp"

/**
 * @file frontier.hpp
 * @brief The fringe of a search: one container, three disciplines.
 */

class Frontier {
public:
    enum class Discipline {
        // Smallest key first, insertion order among equal keys.
        Priority,
        // Insertion order.
        Fifo,
        // Reverse insertion order.
        Lifo
    };

    explicit Frontier(Discipline discipline);

    /**
     * @brief Add a node. `key` is only used by the Priority discipline.
     */
    void push(NodeHandle node, long key = 0);

    /**
     * @brief Remove and return the next node.
     *
     * @throws std::out_of_range if the frontier is empty.
     */
    NodeHandle pop();

    bool empty() const;
    size_t size() const;

    /**
     * @brief The nodes in the order they would be popped.
     */
    std::vector<NodeHandle> snapshot() const;

    void clear();

private:
    struct Entry {
        long key;
        uint64_t sequence;
        NodeHandle node;
    };

    // Heap comparator: true when `a` must be popped after `b`.
    struct PoppedLater {
        bool operator()(const Entry &a, const Entry &b) const {
            if (a.key != b.key) return a.key > b.key;
            return a.sequence > b.sequence;
        }
    };

    Discipline discipline_;
    std::vector<Entry> heap;
    std::deque<NodeHandle> sequence;
    uint64_t next_sequence = 0;
};

#endif // __FRONTIER_HPP___
