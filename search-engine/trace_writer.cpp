#include <ctime>
#include <iomanip>
#include <sstream>

#include "8-puzzle-search-engine.hpp"
#include "trace_writer.hpp"

using namespace std;

static const string SEPARATOR(60, '-');

TraceWriter::TraceWriter(ostream &out, const vector<string> &command_line)
    : out(out), command_line(command_line), method(Method::AStar), header_written(false)
{
}

string TraceWriter::format_node(const NodeArena &arena, NodeHandle handle, Method method) {
    const Node &node = arena[handle];
    ostringstream s;
    s << "< state = " << node.state.to_list_string() << ", action = {"
      << (node.move ? node.move->label() : string("Start")) << "} g(n) = " << node.path_cost
      << ", d = " << node.depth;
    if (node.heuristic) {
        s << ", h(n) = " << *node.heuristic;
    }
    s << ", f(n) = " << frontier_key(method, node) << ", Parent = Pointer to {";
    if (node.parent == NO_PARENT) {
        s << "None";
    } else {
        s << arena[node.parent].state.to_list_string();
    }
    s << "} >";
    return s.str();
}

void TraceWriter::write_snapshot(const NodeArena &arena, const vector<NodeHandle> &fringe, size_t closed_count,
                                 const SearchStats &stats) {
    out << "\tClosed: " << closed_count << " states\n";
    out << "\tFringe: [\n";
    for (NodeHandle h : fringe) {
        out << "\t\t" << format_node(arena, h, method) << "\n";
    }
    out << "\t]\n";
    out << "\tNodes Popped: " << stats.nodes_popped << "\n";
    out << "\tNodes Expanded: " << stats.nodes_expanded << "\n";
    out << "\tNodes Generated: " << stats.nodes_generated << "\n";
    out << "\tMax Fringe Size: " << stats.max_fringe_size << "\n";
    out << SEPARATOR << "\n";
}

void TraceWriter::on_pass_start(Method method, int depth_limit, const State &start, const State &goal,
                                const NodeArena &arena, const vector<NodeHandle> &fringe,
                                const SearchStats &stats) {
    this->method = method;
    method_label = method_name(method);
    if (is_depth_limited(method)) {
        method_label += "(limit=" + to_string(depth_limit) + ")";
    }

    if (!header_written) {
        out << "Command-Line Arguments: [";
        for (size_t i = 0; i < command_line.size(); ++i) {
            if (i) out << ", ";
            out << command_line[i];
        }
        out << "]\n";
        out << "Start State: " << start.to_list_string() << "\n";
        out << "Goal State: " << goal.to_list_string() << "\n";
        header_written = true;
    }
    out << "After Initialization\n";
    write_snapshot(arena, fringe, 0, stats);
    out << "Running " << method_label << "\n";
}

void TraceWriter::on_expand(const NodeArena &arena, NodeHandle expanded, int successors_generated,
                            const vector<NodeHandle> &fringe, size_t closed_count, const SearchStats &stats) {
    out << "Generating successors to " << format_node(arena, expanded, method) << ":\n";
    out << "\t" << successors_generated << " successors generated\n";
    write_snapshot(arena, fringe, closed_count, stats);
}

void TraceWriter::on_finish(const SearchResult &result) {
    out << "Result: " << outcome_name(result.outcome) << "\n";
    out << "\tNodes Popped: " << result.stats.nodes_popped << "\n";
    out << "\tNodes Expanded: " << result.stats.nodes_expanded << "\n";
    out << "\tNodes Generated: " << result.stats.nodes_generated << "\n";
    out << "\tMax Fringe Size: " << result.stats.max_fringe_size << "\n";
    if (result.solved()) {
        out << "\tSolution depth: " << result.depth << ", cost: " << result.path_cost << "\n";
        for (const Move &move : result.moves) {
            out << "\t\t" << move.label() << "\n";
        }
    }
    out.flush();
}

string trace_file_name(chrono::system_clock::time_point when) {
    time_t t = chrono::system_clock::to_time_t(when);
    tm local{};
    localtime_r(&t, &local);
    ostringstream name;
    name << "trace-" << put_time(&local, "%Y-%m-%d-%H-%M-%S") << ".txt";
    return name.str();
}
