#include <iostream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "state.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"

using namespace std;

int main(int argc, char** argv) {
    int depth = 10;
    unsigned int seed = 42;
    string mode = "bfs";
    string goal_file;
    string output_file;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = static_cast<unsigned int>(stoul(argv[++i])); }
            else if (a == "--mode" && i + 1 < argc) { mode = argv[++i]; }
            else if (a == "--goal-file" && i + 1 < argc) { goal_file = argv[++i]; }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: generate-sample-state --output-file F [--depth D] [--seed S] [--mode bfs|walk] [--goal-file G]\n";
                return 0;
            }
            else {
                spdlog::error("Unknown argument {}", a);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Bad numeric argument: {}", e.what());
        return 2;
    }
    if (output_file.empty() || depth < 0 || (mode != "bfs" && mode != "walk")) {
        spdlog::error("An output file, a non-negative depth and a mode of bfs or walk are required");
        return 2;
    }

    try {
        State goal = goal_file.empty() ? State::canonical_goal() : read_state_from_file(goal_file);
        mt19937 rng(seed);
        State sample = mode == "bfs" ? random_state_bfs(goal, depth, rng) : random_state_random_walk(goal, depth, rng);
        write_state_to_file(sample, output_file);
        spdlog::info("Wrote {} (depth {}, seed {}) to {}", sample.to_list_string(), depth, seed, output_file);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
    return 0;
}
