#include <algorithm>
#include <stdexcept>

#include "node_arena.hpp"

using namespace std;

NodeHandle NodeArena::add_root(const State &state) {
    nodes.push_back(Node{state, NO_PARENT, nullopt, 0, 0, nullopt});
    return nodes.size() - 1;
}

NodeHandle NodeArena::add_child(NodeHandle parent, const State &state, const Move &move) {
    if (parent >= nodes.size()) {
        throw out_of_range("Parent handle " + to_string(parent) + " is not in the arena");
    }
    int cost = nodes[parent].path_cost + move.cost;
    int depth = nodes[parent].depth + 1;
    nodes.push_back(Node{state, parent, move, cost, depth, nullopt});
    return nodes.size() - 1;
}

vector<NodeHandle> NodeArena::path_to(NodeHandle handle) const {
    vector<NodeHandle> path;
    for (NodeHandle h = handle; h != NO_PARENT; h = nodes.at(h).parent) {
        path.push_back(h);
    }
    reverse(path.begin(), path.end());
    return path;
}
