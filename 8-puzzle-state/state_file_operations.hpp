#ifndef __STATE_FILE_OPERATIONS_HPP___
#define __STATE_FILE_OPERATIONS_HPP___

#include <istream>
#include <string>

#include "state.hpp"

/**
 * @file state_file_operations.hpp
 * @brief Helpers to read/write `State` values from plain text files.
 *
 * The file format is three lines of three whitespace separated integers
 * (row-major, 0 for the blank) followed by a line containing `END`:
 *
 *     1 2 3
 *     4 0 5
 *     7 8 6
 *     END
 *
 * Blank lines before `END` are ignored, anything after it is not read.
 */

/**
 * @brief Parse a `State` from a stream in the format above.
 *
 * @param in Input stream.
 * @param source Name used in error messages (usually the file name).
 * @throws std::invalid_argument on malformed content.
 * @return Constructed `State` instance.
 */
State read_state_from_stream(std::istream& in, const std::string& source = "<stream>");

/**
 * @brief Read a `State` from a plain-text puzzle file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws std::invalid_argument on malformed content.
 * @return Constructed `State` instance.
 */
State read_state_from_file(const std::string& filename);

/**
 * @brief Write a `State` to a plain-text puzzle file.
 *
 * @param state State to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_state_to_file(const State& state, const std::string& filename);

#endif // __STATE_FILE_OPERATIONS_HPP___
