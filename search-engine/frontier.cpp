#include <algorithm>
#include <stdexcept>

#include "frontier.hpp"

using namespace std;

Frontier::Frontier(Discipline discipline) : discipline_(discipline) {
}

void Frontier::push(NodeHandle node, long key) {
    if (discipline_ == Discipline::Priority) {
        heap.push_back(Entry{key, next_sequence++, node});
        push_heap(heap.begin(), heap.end(), PoppedLater());
    } else {
        sequence.push_back(node);
    }
}

NodeHandle Frontier::pop() {
    if (empty()) {
        throw out_of_range("pop() on an empty frontier");
    }
    NodeHandle node;
    switch (discipline_) {
        case Discipline::Priority:
            pop_heap(heap.begin(), heap.end(), PoppedLater());
            node = heap.back().node;
            heap.pop_back();
            break;
        case Discipline::Fifo:
            node = sequence.front();
            sequence.pop_front();
            break;
        case Discipline::Lifo:
        default:
            node = sequence.back();
            sequence.pop_back();
            break;
    }
    return node;
}

bool Frontier::empty() const {
    return size() == 0;
}

size_t Frontier::size() const {
    return discipline_ == Discipline::Priority ? heap.size() : sequence.size();
}

vector<NodeHandle> Frontier::snapshot() const {
    vector<NodeHandle> nodes;
    nodes.reserve(size());
    switch (discipline_) {
        case Discipline::Priority: {
            vector<Entry> ordered = heap;
            // a comes first when b would be popped after it
            sort(ordered.begin(), ordered.end(), [](const Entry &a, const Entry &b) {
                return PoppedLater()(b, a);
            });
            for (const Entry &e : ordered) nodes.push_back(e.node);
            break;
        }
        case Discipline::Fifo:
            nodes.assign(sequence.begin(), sequence.end());
            break;
        case Discipline::Lifo:
            nodes.assign(sequence.rbegin(), sequence.rend());
            break;
    }
    return nodes;
}

void Frontier::clear() {
    heap.clear();
    sequence.clear();
    next_sequence = 0;
}
