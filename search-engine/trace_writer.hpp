#ifndef __TRACE_WRITER_HPP___
#define __TRACE_WRITER_HPP___

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

#include "search_observer.hpp"

/**
 * @file trace_writer.hpp
 * @brief Search trace dump (`--dump`), written from the engine's event stream.
 *
 * Layout:
 *
 *     Command-Line Arguments: [start.txt, goal.txt, a*, --dump]
 *     After Initialization
 *         <closed count, fringe, counters>
 *     ------------------------------------------------------------
 *     Running a*
 *     Generating successors to < state = ..., action = {Move 5 Up} g(n) = 5, d = 1, ... >:
 *         2 successors generated
 *         <closed count, fringe, counters>
 *     ------------------------------------------------------------
 *     ...
 *     Result: solved
 */
class TraceWriter : public SearchObserver {
public:
    TraceWriter(std::ostream &out, const std::vector<std::string> &command_line);

    void on_pass_start(Method method, int depth_limit, const State &start, const State &goal,
                       const NodeArena &arena, const std::vector<NodeHandle> &fringe,
                       const SearchStats &stats) override;
    void on_expand(const NodeArena &arena, NodeHandle expanded, int successors_generated,
                   const std::vector<NodeHandle> &fringe, size_t closed_count,
                   const SearchStats &stats) override;
    void on_finish(const SearchResult &result) override;

    /**
     * @brief One node in the trace format.
     */
    static std::string format_node(const NodeArena &arena, NodeHandle handle, Method method);

private:
    void write_snapshot(const NodeArena &arena, const std::vector<NodeHandle> &fringe, size_t closed_count,
                        const SearchStats &stats);

    std::ostream &out;
    std::vector<std::string> command_line;
    Method method;
    std::string method_label;
    bool header_written;
};

/**
 * @brief File name of a trace created at `when`: trace-YYYY-MM-DD-HH-MM-SS.txt.
 */
std::string trace_file_name(std::chrono::system_clock::time_point when);

#endif // __TRACE_WRITER_HPP___
