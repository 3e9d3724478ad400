/**
 * @file state.hpp
 * @brief 8-puzzle state representation (3x3 tiles, blank handling, moves).
 *
 * This header declares the State class used by the search engine, the
 * solver and the tools, together with the Move record produced by the
 * move generator.
 */

#ifndef __STATE_HPP___
#define __STATE_HPP___

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

constexpr int SIDE_LENGTH = 3;
constexpr int NUM_CELLS = SIDE_LENGTH * SIDE_LENGTH;
constexpr int BLANK = 0;

/**
 * @brief Direction a tile slides in (from the tile's point of view).
 */
enum class Direction {
    Up,
    Down,
    Left,
    Right
};

/**
 * @brief Human-readable name of a direction ("Up", "Down", "Left", "Right").
 */
const char* direction_name(Direction dir);

/**
 * @brief A single move: tile `tile` slides one cell towards `direction`.
 *
 * The cost of a move is the number on the tile that moved.
 */
struct Move {
    int tile;
    Direction direction;
    int cost;

    /**
     * @brief Label in the form "Move 5 Up".
     */
    std::string label() const;

    bool operator==(const Move &rhs) const {
        return tile == rhs.tile && direction == rhs.direction && cost == rhs.cost;
    }
};

struct Successor;

/**
 * @brief Represents an 8-puzzle board.
 *
 * The class stores the cell values in row-major order, 0 being the blank and
 * 1..8 the tiles. States are values: they are never mutated after creation,
 * successors are new instances.
 */
class State {

private:
    std::vector<int> cells;
    int blank_position;
    void init(const std::vector<int>& cells);
public:
    State();

    /**
     * @brief Construct a State from 9 cell values in row-major order.
     *
     * @param cells Cell values, 0 for the blank and 1..8 for the tiles.
     * @throws std::invalid_argument when the size is not 9, a value is out
     *         of range or a value is duplicated.
     */
    explicit State(const std::vector<int>& cells);

    /**
     * @brief The canonical goal `1 2 3 / 4 5 6 / 7 8 0`.
     */
    static State canonical_goal();

    /**
     * @brief Compute a stable hash for this state.
     *
     * The hash is suitable for use in unordered containers.
     * @return A size_t hash value.
     */
    size_t hash() const;

    /**
     * @brief Value stored at a row-major cell index (0..8).
     */
    int at(int position) const;

    /**
     * @brief Row-major cell index of the given tile (0 for the blank).
     */
    int position_of(int tile) const;

    /**
     * @brief Return the row index (0-based) of the given tile.
     */
    int get_tile_row(int tile) const;

    /**
     * @brief Return the column index (0-based) of the given tile.
     */
    int get_tile_column(int tile) const;

    /**
     * @brief Row-major index of the blank cell.
     */
    int get_blank_position() const;

    /**
     * @brief Generate all legal successors of this state.
     *
     * The blank's neighbours are checked in the fixed order above, below,
     * left, right. The tile above the blank therefore moves Down, the one
     * below moves Up, the one on the left moves Right and the one on the
     * right moves Left. This order decides tie-breaking in the search engine
     * and is part of the contract.
     *
     * @return 2, 3 or 4 successors depending on the blank position.
     */
    std::vector<Successor> get_available_moves() const;

    /**
     * @brief Apply a labelled move to this state.
     *
     * @throws std::invalid_argument if the tile cannot move that way.
     * @return The resulting state.
     */
    State apply(const Move &move) const;

    /**
     * @brief Inversion parity of the tiles (blank excluded), 0 or 1.
     *
     * Invariant under legal moves on a board of odd width.
     */
    int parity() const;

    /**
     * @brief Grid rendering, one row per line: "1 2 3\n4 0 5\n7 8 6".
     */
    std::string to_string() const;

    /**
     * @brief Nested list rendering: "[[1, 2, 3], [4, 0, 5], [7, 8, 6]]".
     */
    std::string to_list_string() const;

    bool operator==(const State &rhs) const;
    bool operator!=(const State &rhs) const;
};

/**
 * @brief A successor produced by the move generator.
 */
struct Successor {
    State state;
    Move move;
};

/**
 * @brief Whether `goal` can be reached from `start` by legal moves.
 *
 * Both states lie in the same component of the state graph iff their
 * parities agree.
 */
bool is_reachable(const State &start, const State &goal);

namespace std {
template <>
struct hash<State> {
    size_t operator()(const State &s) const { return s.hash(); }
};
}

#endif // __STATE_HPP___
