#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "search_types.hpp"

using namespace std;

const vector<Method>& all_methods() {
    static const vector<Method> methods = {
        Method::AStar,
        Method::Greedy,
        Method::UniformCost,
        Method::BreadthFirst,
        Method::DepthFirst,
        Method::DepthLimited,
        Method::IterativeDeepening,
    };
    return methods;
}

string method_name(Method method) {
    switch (method) {
        case Method::AStar:
            return "a*";
        case Method::Greedy:
            return "greedy";
        case Method::UniformCost:
            return "ucs";
        case Method::BreadthFirst:
            return "bfs";
        case Method::DepthFirst:
            return "dfs";
        case Method::DepthLimited:
            return "dls";
        case Method::IterativeDeepening:
            return "ids";
    }
    throw invalid_argument("Unknown method");
}

Method parse_method(const string& name) {
    string lowered = name;
    transform(lowered.begin(), lowered.end(), lowered.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    if (lowered == "astar") return Method::AStar;
    for (Method m : all_methods()) {
        if (method_name(m) == lowered) return m;
    }
    throw invalid_argument("Unknown method '" + name + "' (expected one of a*, greedy, ucs, bfs, dfs, dls, ids)");
}

bool uses_heuristic(Method method) {
    return method == Method::AStar || method == Method::Greedy;
}

bool is_depth_limited(Method method) {
    return method == Method::DepthLimited || method == Method::IterativeDeepening;
}

string outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::Solved:
            return "solved";
        case Outcome::Exhausted:
            return "exhausted";
        case Outcome::DepthExceeded:
            return "depth-exceeded";
        case Outcome::NodeLimitReached:
            return "node-limit";
    }
    return "unknown";
}
