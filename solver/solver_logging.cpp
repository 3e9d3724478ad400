#include <spdlog/sinks/stdout_color_sinks.h>

#include "solver_logging.hpp"

using namespace std;

shared_ptr<spdlog::logger> make_solver_logger(const string &name, bool verbose) {
    auto logger = make_shared<spdlog::logger>(name, make_shared<spdlog::sinks::stderr_color_sink_st>());
    logger->set_pattern("[%l] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    return logger;
}
