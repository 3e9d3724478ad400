#ifndef __SOLVER_OPTIONS_HPP___
#define __SOLVER_OPTIONS_HPP___

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "search_types.hpp"

/**
 * @file solver_options.hpp
 * @brief Command-line options of the `expense-8-puzzle` solver.
 */

struct SolverOptions {
    std::string start_file;
    std::string goal_file;
    Method method = Method::AStar;
    bool dump = false;
    // Only meaningful for dls; prompted for when missing.
    std::optional<int> depth_limit;
    int max_depth = 1000;
    size_t max_nodes = 0;
    bool parity_check = true;
    bool verbose = false;
    bool help = false;

    /**
     * @brief Engine options equivalent to these command-line options.
     */
    SearchOptions search_options() const;
};

/**
 * @brief Parse the arguments that follow the program name.
 *
 * <start_file> <goal_file> [method] [depth_limit] [dump_flag] [options]
 *
 * The method is case-insensitive and defaults to a*. A trailing integer is
 * the depth limit when the method is dls. `--dump`, `-d` or a trailing
 * `true`, `1` or `yes` turn on the trace dump.
 *
 * @throws std::invalid_argument on unknown options, unknown methods, bad
 *         numbers or missing files.
 */
SolverOptions parse_solver_arguments(const std::vector<std::string>& args);

/**
 * @brief Parse a non-negative integer argument.
 *
 * @param what Name used in the error message.
 * @throws std::invalid_argument if `text` is not a non-negative integer.
 */
long parse_non_negative(const std::string& text, const std::string& what);

std::string solver_usage(const std::string& program);

#endif // __SOLVER_OPTIONS_HPP___
