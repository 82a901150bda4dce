#ifndef _sudoku_config_h_included_
#define _sudoku_config_h_included_

#include "logging.h"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>


namespace sudoku {

struct config_t {
	std::string input_path = "sudoku.txt"; // "-" is stdin
	bool parallel = false;
	size_t workers = 0;                    // 0: one per hardware thread
	bool count = false;                    // report whether the solution is unique
	bool detailed = false;
	bool pause = false;
	bool help = false;
	logging::level_t log_level = logging::level_t::info;
};

// throws std::runtime_error on unknown options and bad values
config_t parse_args(const std::vector<std::string>& args);
config_t parse_args(int argc, const char* const* argv);

void usage(std::ostream& os, const char* argv0);

} // namespace sudoku

#endif
