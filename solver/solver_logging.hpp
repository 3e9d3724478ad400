#ifndef __SOLVER_LOGGING_HPP___
#define __SOLVER_LOGGING_HPP___

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief Colored stderr logger of the solver, "[level] message".
 *
 * Level is info, or debug when `verbose` is set. The logger is not registered,
 * pass it to `spdlog::set_default_logger` to route `spdlog::info` and friends.
 */
std::shared_ptr<spdlog::logger> make_solver_logger(const std::string &name, bool verbose);

#endif // __SOLVER_LOGGING_HPP___
