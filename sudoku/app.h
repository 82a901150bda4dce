#ifndef _sudoku_app_h_included_
#define _sudoku_app_h_included_

#include "config.h"

#include <iosfwd>


namespace sudoku {

enum exit_code_t : int {
	exit_solved = 0,
	exit_no_solution = 1,
	exit_error = 2,           // bad input, unreadable file
	exit_verify_failed = 3,
};

// Reads the puzzle (from `in` when the input path is "-"), solves it and prints
// the grid to `out`. Nothing is written to `out` unless a solution is found.
// Input errors are logged and reported as exit_error.
int run(const config_t& cfg, std::istream& in, std::ostream& out);

} // namespace sudoku

#endif
