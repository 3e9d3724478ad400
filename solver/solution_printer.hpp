#ifndef __SOLUTION_PRINTER_HPP___
#define __SOLUTION_PRINTER_HPP___

#include <ostream>

#include "search_types.hpp"

/**
 * @brief Print the statistics and the solution (or its absence) of a run.
 *
 *     Nodes Popped: 97
 *     Nodes Expanded: 64
 *     Nodes Generated: 173
 *     Max Fringe Size: 40
 *     Solution Found at depth 2 with cost of 11.
 *     Steps:
 *             Move 5 Left
 *             Move 6 Up
 */
void print_result(std::ostream &out, const SearchResult &result);

#endif // __SOLUTION_PRINTER_HPP___
