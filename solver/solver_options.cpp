#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "solver_options.hpp"

using namespace std;

static bool is_integer(const string& text) {
    return !text.empty() && all_of(text.begin(), text.end(), [](unsigned char c) { return isdigit(c); });
}

static string lowered(const string& text) {
    string out = text;
    transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return out;
}

long parse_non_negative(const string& text, const string& what) {
    if (!is_integer(text)) {
        throw invalid_argument(what + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        return stol(text);
    } catch (const out_of_range&) {
        throw invalid_argument(what + " is too large: " + text);
    }
}

static int parse_int_option(const string& text, const string& what) {
    long value = parse_non_negative(text, what);
    if (value > numeric_limits<int>::max()) {
        throw invalid_argument(what + " is too large: " + text);
    }
    return static_cast<int>(value);
}

SearchOptions SolverOptions::search_options() const {
    SearchOptions options;
    options.method = method;
    options.depth_limit = depth_limit.value_or(-1);
    options.max_depth = max_depth;
    options.max_nodes = max_nodes;
    options.parity_check = parity_check;
    return options;
}

SolverOptions parse_solver_arguments(const vector<string>& args) {
    SolverOptions options;
    vector<string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const string& a = args[i];
        auto value = [&](const string& flag) -> const string& {
            if (i + 1 >= args.size()) {
                throw invalid_argument(flag + " expects a value");
            }
            return args[++i];
        };
        if (a == "--dump" || a == "-d") { options.dump = true; }
        else if (a == "--depth-limit") { options.depth_limit = parse_int_option(value(a), "depth limit"); }
        else if (a == "--max-depth") { options.max_depth = parse_int_option(value(a), "maximum depth"); }
        else if (a == "--max-nodes") { options.max_nodes = static_cast<size_t>(parse_non_negative(value(a), "node budget")); }
        else if (a == "--no-parity-check") { options.parity_check = false; }
        else if (a == "--verbose" || a == "-v") { options.verbose = true; }
        else if (a == "--help" || a == "-h") { options.help = true; }
        else if (a.size() > 1 && a[0] == '-' && a != "-") {
            throw invalid_argument("Unknown option " + a);
        }
        else { positional.push_back(a); }
    }

    if (options.help) return options;

    if (positional.size() < 2) {
        throw invalid_argument("Both a start file and a goal file are required");
    }
    options.start_file = positional[0];
    options.goal_file = positional[1];
    if (positional.size() > 2) {
        options.method = parse_method(positional[2]);
    }

    for (size_t i = 3; i < positional.size(); ++i) {
        const string token = lowered(positional[i]);
        if (options.method == Method::DepthLimited && is_integer(token) && !options.depth_limit) {
            options.depth_limit = parse_int_option(token, "depth limit");
        } else if (token == "true" || token == "1" || token == "yes") {
            options.dump = true;
        } else if (token == "false" || token == "0" || token == "no") {
            options.dump = false;
        } else {
            throw invalid_argument("Unexpected argument '" + positional[i] + "'");
        }
    }
    return options;
}

string solver_usage(const string& program) {
    ostringstream out;
    out << "Usage: " << program << " <start-file> <goal-file> [method] [depth-limit] [--dump] [options]\n"
        << "\n"
        << "Methods (case-insensitive, default a*):\n"
        << "  a*, greedy, ucs, bfs, dfs, dls, ids\n"
        << "\n"
        << "Options:\n"
        << "  -d, --dump           write a search trace to trace-<timestamp>.txt\n"
        << "  --depth-limit N      depth limit for dls (prompted for when missing)\n"
        << "  --max-depth N        largest limit tried by ids (default 1000)\n"
        << "  --max-nodes N        stop after N popped nodes (default: no limit)\n"
        << "  --no-parity-check    search even when start and goal differ in parity\n"
        << "  -v, --verbose        debug logging\n"
        << "  -h, --help           show this message\n";
    return out.str();
}
