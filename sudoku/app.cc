#include "app.h"

#include "logging.h"
#include "presentation.h"
#include "search.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <thread>


namespace sudoku {

namespace {

puzzle_t read_input(const config_t& cfg, std::istream& in)
{
	if (cfg.input_path == "-") {
		return read_puzzle(in);
	}
	return read_puzzle_file(cfg.input_path);
}


// first solution plus whether a second one exists, in one pass
std::optional<board_t> search_counting(const board_t& board, bool& unique, search_stats_t& stats)
{
	std::optional<board_t> first;
	size_t found = 0;
	search_all(
		board,
		[&first, &found](const board_t& solved) {
			if (!first) {
				first = solved;
			}
			return ++found < 2;
		},
		&stats
	);
	unique = (found == 1);
	return first;
}


int solve(const config_t& cfg, std::istream& in, std::ostream& out)
{
	auto const puzzle = read_input(cfg, in);
	logging::debug() << "puzzle: " << puzzle << "\n";

	auto const board = load_puzzle(puzzle);
	if (!board) {
		logging::info() << "No solution: givens contradict each other\n";
		return exit_no_solution;
	}

	search_stats_t stats;
	std::optional<board_t> solved;
	bool unique = false;
	if (cfg.count) {
		if (cfg.parallel) {
			logging::warning() << "--count searches sequentially, --parallel ignored\n";
		}
		solved = search_counting(*board, unique, stats);
	} else if (cfg.parallel) {
		size_t workers = cfg.workers;
		if (workers == 0) {
			workers = std::max(1u, std::thread::hardware_concurrency());
		}
		solved = search_parallel(*board, workers, &stats);
	} else {
		solved = search(*board, &stats);
	}
	logging::debug() << "search: " << stats << "\n";

	if (!solved) {
		logging::info() << "No solution found\n";
		return exit_no_solution;
	}
	if (!solved->verify()) {
		// propagation guarantees this, a failure is a bug
		logging::error() << "Solution failed verification\n";
		return exit_verify_failed;
	}

	print(out, *solved);
	if (cfg.detailed) {
		out << "\n";
		print_detailed(out, *solved);
	}
	if (cfg.count) {
		out << (unique ? "Solution is unique\n" : "Puzzle has more than one solution\n");
	}
	return exit_solved;
}

} // namespace


int run(const config_t& cfg, std::istream& in, std::ostream& out)
{
	try {
		return solve(cfg, in, out);
	} catch (const std::exception& e) {
		logging::error() << "Exception: " << e.what() << "\n";
		return exit_error;
	}
}

} // namespace sudoku
