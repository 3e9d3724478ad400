#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "state.hpp"
#include "state_file_operations.hpp"
#include "8-puzzle-search-engine.hpp"
#include "trace_writer.hpp"
#include "solver_options.hpp"
#include "solution_printer.hpp"
#include "solver_logging.hpp"

using namespace std;

// Exit codes
static const int EXIT_SOLVED = 0;
static const int EXIT_NO_SOLUTION = 1;
static const int EXIT_BAD_INPUT = 2;
static const int EXIT_UNREACHABLE = 3;

static int prompt_depth_limit() {
    cout << "Enter depth limit for DLS: " << flush;
    string line;
    if (!getline(cin, line)) {
        throw invalid_argument("dls requires a depth limit and none was entered");
    }
    size_t b = line.find_first_not_of(" \t\r");
    size_t e = line.find_last_not_of(" \t\r");
    string trimmed = b == string::npos ? string() : line.substr(b, e - b + 1);
    return static_cast<int>(parse_non_negative(trimmed, "depth limit"));
}

int main(int argc, char** argv) {
    spdlog::set_default_logger(make_solver_logger("expense-8-puzzle", false));

    string program = argc > 0 ? argv[0] : "expense-8-puzzle";
    vector<string> args(argv + 1, argv + argc);

    SolverOptions options;
    try {
        options = parse_solver_arguments(args);
    } catch (const invalid_argument& e) {
        spdlog::error("{}", e.what());
        cerr << solver_usage(program);
        return EXIT_BAD_INPUT;
    }
    if (options.help) {
        cout << solver_usage(program);
        return EXIT_SOLVED;
    }
    if (options.verbose) {
        spdlog::set_default_logger(make_solver_logger("expense-8-puzzle", true));
    }

    State start_state;
    State goal_state;
    try {
        start_state = read_state_from_file(options.start_file);
        goal_state = read_state_from_file(options.goal_file);
        if (options.method == Method::DepthLimited && !options.depth_limit) {
            options.depth_limit = prompt_depth_limit();
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_BAD_INPUT;
    }

    spdlog::debug("start {} goal {} method {}", start_state.to_list_string(), goal_state.to_list_string(),
                  method_name(options.method));

    if (options.parity_check && !is_reachable(start_state, goal_state)) {
        spdlog::error("Goal {} is unreachable from {}: the two states differ in parity",
                      goal_state.to_list_string(), start_state.to_list_string());
        cout << "No solution found.\n";
        return EXIT_UNREACHABLE;
    }

    string trace_name;
    ofstream trace_file;
    unique_ptr<TraceWriter> trace;
    if (options.dump) {
        trace_name = trace_file_name(chrono::system_clock::now());
        trace_file.open(trace_name);
        if (!trace_file.is_open()) {
            spdlog::error("Could not open trace file {}", trace_name);
            return EXIT_BAD_INPUT;
        }
        trace = make_unique<TraceWriter>(trace_file, args);
    }

    SearchResult result;
    try {
        auto t0 = chrono::steady_clock::now();
        result = PuzzleSolve(start_state, goal_state, options.search_options(), trace.get());
        auto t1 = chrono::steady_clock::now();
        double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();
        spdlog::info("{} finished in {:.3f} ms: {}", method_name(options.method), ms, outcome_name(result.outcome));
    } catch (const invalid_argument& e) {
        spdlog::error("{}", e.what());
        return EXIT_BAD_INPUT;
    }

    print_result(cout, result);
    if (trace) {
        cout << "Search trace written to " << trace_name << "\n";
    }
    return result.solved() ? EXIT_SOLVED : EXIT_NO_SOLUTION;
}
