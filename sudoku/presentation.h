#ifndef _sudoku_presentation_h_included_
#define _sudoku_presentation_h_included_

#include "board.h"

#include <iosfwd>
#include <optional>
#include <string>


namespace sudoku {

// The first 81 characters in row-major order, taken as they are.
// '1'..'9' are givens, any other character (whitespace included) is a blank.
using puzzle_t = std::string;

// throws std::runtime_error if fewer than 81 characters are available
puzzle_t read_puzzle(std::istream& is);
puzzle_t read_puzzle_file(const std::string& path);

// throws std::runtime_error if the puzzle is shorter than 81 characters;
// std::nullopt when the givens already contradict each other
std::optional<board_t> load_puzzle(const puzzle_t& puzzle, const topology_t& topology = topology_t::instance());

// one row per line, every square right-aligned in a fixed-width field;
// unsolved squares show all their candidates
void print(std::ostream& os, const board_t& board);
// full candidate map, 3x3 digits per square
void print_detailed(std::ostream& os, const board_t& board);
// 81 characters, '.' for unsolved squares
std::string to_line(const board_t& board);

} // namespace sudoku

#endif
