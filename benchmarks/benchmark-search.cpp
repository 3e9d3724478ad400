#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "state.hpp"
#include "8-puzzle-search-engine.hpp"
#include "generate_sample_state.hpp"

using namespace std;

static vector<Method> parse_method_list(const string& raw) {
    vector<Method> methods;
    stringstream ss(raw);
    string token;
    while (getline(ss, token, ',')) {
        methods.push_back(parse_method(token));
    }
    return methods;
}

int main(int argc, char** argv) {
    int depth = 12;
    int instances = 5;
    size_t max_nodes = 0;
    vector<Method> methods = all_methods();
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--instances" && i + 1 < argc) { instances = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--methods" && i + 1 < argc) { methods = parse_method_list(argv[++i]); }
            else if (a == "--max-nodes" && i + 1 < argc) { max_nodes = stoul(argv[++i]); }
            else if (a == "--help") {
                cout << "Usage: benchmark-search [--depth D] [--instances N] [--seed S] [--methods a*,ucs,...] [--max-nodes N]\n";
                return 0;
            }
            else {
                spdlog::error("Unknown argument {}", a);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Bad argument: {}", e.what());
        return 2;
    }

    if (depth < 0 || instances < 1) {
        spdlog::error("depth must be >= 0 and instances >= 1");
        return 3;
    }

    mt19937 rng(seed);
    State goal_state = State::canonical_goal();
    spdlog::info("seed {}, depth {}, {} instances", seed, depth, instances);

    // CSV header
    cout << "instance_id,method,outcome,time_ms,depth,cost,popped,expanded,generated,max_fringe" << '\n';

    for (int instance = 0; instance < instances; ++instance) {
        State start_state = random_state_random_walk(goal_state, depth, rng);
        spdlog::debug("instance {}: {}", instance, start_state.to_list_string());

        for (Method method : methods) {
            SearchOptions options;
            options.method = method;
            options.depth_limit = depth;
            options.max_nodes = max_nodes;

            auto t0 = chrono::steady_clock::now();
            SearchResult result = PuzzleSolve(start_state, goal_state, options);
            auto t1 = chrono::steady_clock::now();
            double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

            cout << instance << ',' << method_name(method) << ',' << outcome_name(result.outcome) << ','
                 << ms << ',' << result.depth << ',' << result.path_cost << ','
                 << result.stats.nodes_popped << ',' << result.stats.nodes_expanded << ','
                 << result.stats.nodes_generated << ',' << result.stats.max_fringe_size << '\n';
        }
    }

    return 0;
}
