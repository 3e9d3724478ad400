#include "solution_printer.hpp"

using namespace std;

void print_result(ostream &out, const SearchResult &result) {
    out << "Nodes Popped: " << result.stats.nodes_popped << "\n";
    out << "Nodes Expanded: " << result.stats.nodes_expanded << "\n";
    out << "Nodes Generated: " << result.stats.nodes_generated << "\n";
    out << "Max Fringe Size: " << result.stats.max_fringe_size << "\n";

    switch (result.outcome) {
        case Outcome::Solved:
            out << "Solution Found at depth " << result.depth << " with cost of " << result.path_cost << ".\n";
            out << "Steps:\n";
            for (const Move &move : result.moves) {
                out << "        " << move.label() << "\n";
            }
            break;
        case Outcome::DepthExceeded:
            out << "No solution found within depth limit " << result.depth_limit << ".\n";
            break;
        case Outcome::NodeLimitReached:
            out << "No solution found within the node budget.\n";
            break;
        case Outcome::Exhausted:
            out << "No solution found.\n";
            break;
    }
}
