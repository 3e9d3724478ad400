// Google Test for the frontier disciplines and the node arena
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "frontier.hpp"
#include "node_arena.hpp"

static std::vector<NodeHandle> drain(Frontier& f) {
    std::vector<NodeHandle> out;
    while (!f.empty()) out.push_back(f.pop());
    return out;
}

TEST(Frontier, FifoPopsInInsertionOrder) {
    Frontier f(Frontier::Discipline::Fifo);
    for (NodeHandle h : {3, 1, 2}) f.push(h);
    EXPECT_EQ(f.size(), 3u);
    EXPECT_EQ(drain(f), (std::vector<NodeHandle>{3, 1, 2}));
}

TEST(Frontier, LifoPopsInReverseInsertionOrder) {
    Frontier f(Frontier::Discipline::Lifo);
    for (NodeHandle h : {3, 1, 2}) f.push(h);
    EXPECT_EQ(drain(f), (std::vector<NodeHandle>{2, 1, 3}));
}

TEST(Frontier, PriorityPopsSmallestKeyFirst) {
    Frontier f(Frontier::Discipline::Priority);
    f.push(10, 7);
    f.push(11, 3);
    f.push(12, 5);
    EXPECT_EQ(drain(f), (std::vector<NodeHandle>{11, 12, 10}));
}

TEST(Frontier, PriorityBreaksTiesByInsertionOrder) {
    Frontier f(Frontier::Discipline::Priority);
    for (NodeHandle h = 0; h < 20; ++h) f.push(h, 4);
    f.push(100, 1);
    std::vector<NodeHandle> expected = {100};
    for (NodeHandle h = 0; h < 20; ++h) expected.push_back(h);
    EXPECT_EQ(drain(f), expected);
}

TEST(Frontier, SnapshotIsInPopOrder) {
    Frontier pq(Frontier::Discipline::Priority);
    pq.push(1, 9);
    pq.push(2, 2);
    pq.push(3, 2);
    pq.push(4, 0);
    std::vector<NodeHandle> snap = pq.snapshot();
    EXPECT_EQ(snap, drain(pq));

    Frontier stack(Frontier::Discipline::Lifo);
    for (NodeHandle h : {1, 2, 3}) stack.push(h);
    EXPECT_EQ(stack.snapshot(), (std::vector<NodeHandle>{3, 2, 1}));
    EXPECT_EQ(stack.size(), 3u);
}

TEST(Frontier, PopOnEmptyThrows) {
    Frontier f(Frontier::Discipline::Fifo);
    EXPECT_THROW(f.pop(), std::out_of_range);
}

TEST(Frontier, ClearResetsTieBreakSequence) {
    Frontier f(Frontier::Discipline::Priority);
    f.push(1, 0);
    f.clear();
    EXPECT_TRUE(f.empty());
    f.push(2, 0);
    f.push(3, 0);
    EXPECT_EQ(drain(f), (std::vector<NodeHandle>{2, 3}));
}

TEST(NodeArena, ChildrenAccumulateCostAndDepth) {
    NodeArena arena;
    State start({1, 2, 3, 4, 0, 5, 7, 8, 6});
    NodeHandle root = arena.add_root(start);
    auto first = start.get_available_moves()[3];  // Move 5 Left
    NodeHandle child = arena.add_child(root, first.state, first.move);
    auto second = first.state.get_available_moves()[1];  // Move 6 Up
    NodeHandle grandchild = arena.add_child(child, second.state, second.move);

    EXPECT_EQ(arena[root].parent, NO_PARENT);
    EXPECT_FALSE(arena[root].move.has_value());
    EXPECT_EQ(arena[child].path_cost, 5);
    EXPECT_EQ(arena[grandchild].path_cost, 11);
    EXPECT_EQ(arena[grandchild].depth, 2);
    EXPECT_EQ(arena[grandchild].state, State::canonical_goal());
    EXPECT_EQ(arena.path_to(grandchild), (std::vector<NodeHandle>{root, child, grandchild}));
    EXPECT_EQ(arena.size(), 3u);
}

TEST(NodeArena, UnknownParentThrows) {
    NodeArena arena;
    State s;
    EXPECT_THROW(arena.add_child(4, s, Move{1, Direction::Up, 1}), std::out_of_range);
}
