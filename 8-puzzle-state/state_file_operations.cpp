#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state_file_operations.hpp"

using namespace std;

static const string TERMINATOR = "END";

static string trim(const string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static int parse_cell(const string& token, const string& source, int line_no) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = stoi(token, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != token.size()) {
        throw invalid_argument(source + ":" + to_string(line_no) + ": '" + token + "' is not an integer");
    }
    return value;
}

State read_state_from_stream(istream& in, const string& source) {
    vector<int> cells;
    int rows = 0;
    int line_no = 0;
    bool terminated = false;
    string line;
    while (getline(in, line)) {
        ++line_no;
        string content = trim(line);
        if (content.empty()) continue;
        if (content == TERMINATOR) {
            terminated = true;
            break;
        }
        if (rows == SIDE_LENGTH) {
            throw invalid_argument(source + ":" + to_string(line_no) + ": expected '" + TERMINATOR +
                                   "' after " + to_string(SIDE_LENGTH) + " rows");
        }
        istringstream tokens(content);
        string token;
        int width = 0;
        while (tokens >> token) {
            cells.push_back(parse_cell(token, source, line_no));
            ++width;
        }
        if (width != SIDE_LENGTH) {
            throw invalid_argument(source + ":" + to_string(line_no) + ": expected " + to_string(SIDE_LENGTH) +
                                   " values per row, got " + to_string(width));
        }
        ++rows;
    }
    if (!terminated) {
        throw invalid_argument(source + ": missing '" + TERMINATOR + "' terminator line");
    }
    if (rows != SIDE_LENGTH) {
        throw invalid_argument(source + ": expected " + to_string(SIDE_LENGTH) + " rows, got " + to_string(rows));
    }
    try {
        return State(cells);
    } catch (const invalid_argument& e) {
        throw invalid_argument(source + ": " + e.what());
    }
}

State read_state_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    return read_state_from_stream(infile, filename);
}

void write_state_to_file(const State& state, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    outfile << state.to_string() << "\n" << TERMINATOR << "\n";
}
