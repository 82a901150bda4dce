#include "app.h"
#include "config.h"
#include "logging.h"

#include <exception>
#include <iostream>


namespace {

void wait_for_key()
{
	std::cout << "Press any key to continue..." << std::flush;
	std::cin.get();
}

} // namespace


int main(int argc, char** argv)
{
	sudoku::config_t cfg;
	try {
		cfg = sudoku::parse_args(argc, argv);
	} catch (const std::exception& e) {
		logging::error() << e.what() << "\n";
		sudoku::usage(std::cerr, argv[0]);
		return sudoku::exit_error;
	}

	if (cfg.help) {
		sudoku::usage(std::cout, argv[0]);
		return sudoku::exit_solved;
	}
	logging::set_level(cfg.log_level);

	int const rc = sudoku::run(cfg, std::cin, std::cout);

	if (cfg.pause) {
		wait_for_key();
	}
	return rc;
}
