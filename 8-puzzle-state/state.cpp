#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

#include "state.hpp"

using namespace std;

const char* direction_name(Direction dir) {
    switch (dir) {
        case Direction::Up:
            return "Up";
        case Direction::Down:
            return "Down";
        case Direction::Left:
            return "Left";
        case Direction::Right:
            return "Right";
    }
    return "?";
}

string Move::label() const {
    return "Move " + std::to_string(tile) + " " + direction_name(direction);
}

void State::init(const vector<int>& cells) {
    if (cells.size() != static_cast<size_t>(NUM_CELLS)) {
        throw invalid_argument("State must have exactly " + std::to_string(NUM_CELLS) + " cells, got " +
                               std::to_string(cells.size()));
    }
    vector<bool> seen(NUM_CELLS, false);
    for (int i = 0; i < NUM_CELLS; ++i) {
        if (cells[i] < 0 || cells[i] >= NUM_CELLS) {
            throw invalid_argument("Tile values must be in range [0,8], got " + std::to_string(cells[i]));
        }
        if (seen[cells[i]]) {
            throw invalid_argument("Duplicate tile value " + std::to_string(cells[i]));
        }
        seen[cells[i]] = true;
    }
    this->cells = cells;
    for (int i = 0; i < NUM_CELLS; ++i) {
        if (cells[i] == BLANK) this->blank_position = i;
    }
}

State::State() {
    init({1, 2, 3, 4, 5, 6, 7, 8, 0});
}

State::State(const vector<int>& cells) {
    init(cells);
}

State State::canonical_goal() {
    return State();
}

size_t State::hash() const {
    // The cells form a base-9 number below 9^9, which fits in 32 bits
    size_t h = 0;
    for (int v : cells) {
        h = h * NUM_CELLS + static_cast<size_t>(v);
    }
    return h;
}

int State::at(int position) const {
    return cells.at(position);
}

int State::position_of(int tile) const {
    for (int i = 0; i < NUM_CELLS; ++i) {
        if (cells[i] == tile) return i;
    }
    throw invalid_argument("Tile " + std::to_string(tile) + " is not on the board");
}

int State::get_tile_row(int tile) const {
    return position_of(tile) / SIDE_LENGTH;
}

int State::get_tile_column(int tile) const {
    return position_of(tile) % SIDE_LENGTH;
}

int State::get_blank_position() const {
    return blank_position;
}

vector<Successor> State::get_available_moves() const {
    vector<Successor> moves;
    moves.reserve(4);
    int row = blank_position / SIDE_LENGTH;
    int col = blank_position % SIDE_LENGTH;

    // Neighbour of the blank (offset) and the direction the neighbouring tile slides in
    struct Neighbour {
        bool valid;
        int offset;
        Direction tile_direction;
    };
    const Neighbour neighbours[] = {
        {row > 0, -SIDE_LENGTH, Direction::Down},
        {row < SIDE_LENGTH - 1, SIDE_LENGTH, Direction::Up},
        {col > 0, -1, Direction::Right},
        {col < SIDE_LENGTH - 1, 1, Direction::Left},
    };

    for (const Neighbour &n : neighbours) {
        if (!n.valid) continue;
        int tile_pos = blank_position + n.offset;
        int tile = cells[tile_pos];
        vector<int> new_cells = cells;
        new_cells[blank_position] = tile;
        new_cells[tile_pos] = BLANK;
        moves.push_back({State(new_cells), Move{tile, n.tile_direction, tile}});
    }
    return moves;
}

State State::apply(const Move &move) const {
    for (const auto &succ : get_available_moves()) {
        if (succ.move.tile == move.tile && succ.move.direction == move.direction) {
            return succ.state;
        }
    }
    throw invalid_argument("Illegal move '" + move.label() + "' for state " + to_list_string());
}

int State::parity() const {
    int inversions = 0;
    for (int i = 0; i < NUM_CELLS; ++i) {
        if (cells[i] == BLANK) continue;
        for (int j = i + 1; j < NUM_CELLS; ++j) {
            if (cells[j] != BLANK && cells[j] < cells[i]) ++inversions;
        }
    }
    return inversions % 2;
}

string State::to_string() const {
    ostringstream out;
    for (int r = 0; r < SIDE_LENGTH; ++r) {
        if (r) out << '\n';
        for (int c = 0; c < SIDE_LENGTH; ++c) {
            if (c) out << ' ';
            out << cells[r * SIDE_LENGTH + c];
        }
    }
    return out.str();
}

string State::to_list_string() const {
    ostringstream out;
    out << '[';
    for (int r = 0; r < SIDE_LENGTH; ++r) {
        if (r) out << ", ";
        out << '[';
        for (int c = 0; c < SIDE_LENGTH; ++c) {
            if (c) out << ", ";
            out << cells[r * SIDE_LENGTH + c];
        }
        out << ']';
    }
    out << ']';
    return out.str();
}

bool State::operator==(const State &rhs) const {
    return cells == rhs.cells;
}

bool State::operator!=(const State &rhs) const {
    return !(*this == rhs);
}

bool is_reachable(const State &start, const State &goal) {
    return start.parity() == goal.parity();
}
