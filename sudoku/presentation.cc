#include "presentation.h"

#include "logging.h"

#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>


namespace sudoku {

namespace {

[[noreturn]] void throw_too_short(size_t got)
{
	std::ostringstream oss;
	oss << "Puzzle too short: expected " << square_count << " characters, got " << got;
	throw std::runtime_error(oss.str());
}

constexpr size_t detailed_width = 61;

void print_rule(std::ostream& os, char c)
{
	os << std::string(detailed_width, c) << '\n';
}

// candidate digits digit_row*3+1 .. digit_row*3+3 of every square in `row`
void print_candidate_row(std::ostream& os, const board_t& board, num_t row, num_t digit_row)
{
	os << ' ';
	for (num_t col = 0; col < N; ++col) {
		if (col != 0) {
			os << (col % Ns == 0 ? "  |||  " : " | ");
		}
		const auto& cell = board.candidates(square_t(row, col));
		for (num_t k = 0; k < Ns; ++k) {
			num_t const n = digit_row * Ns + k;
			os << (cell.has(n) ? num_print(n) : ' ');
		}
	}
	os << '\n';
}

} // namespace


puzzle_t read_puzzle(std::istream& is)
{
	puzzle_t puzzle;
	puzzle.reserve(square_count);
	auto iter = std::istreambuf_iterator<char>(is);
	for (; puzzle.size() < square_count && iter != std::istreambuf_iterator<char>(); ++iter) {
		puzzle.push_back(*iter);
	}
	if (puzzle.size() < square_count) {
		throw_too_short(puzzle.size());
	}
	return puzzle;
}


puzzle_t read_puzzle_file(const std::string& path)
{
	std::ifstream is(path);
	if (!is) {
		throw std::runtime_error("Failed to open puzzle file: " + path);
	}
	return read_puzzle(is);
}


std::optional<board_t> load_puzzle(const puzzle_t& puzzle, const topology_t& topology)
{
	if (puzzle.size() < square_count) {
		throw_too_short(puzzle.size());
	}

	board_t board(topology);
	size_t givens = 0;
	for (size_t sq = 0; sq < square_count; ++sq) {
		char const c = puzzle.at(sq);
		if (!num_is_digit(c)) {
			continue;
		}
		++givens;
		if (board.assign(static_cast<square_idx_t>(sq), num_parse(c)) != status_t::ok) {
			logging::debug() << "load_puzzle: given " << c << " at " << square_t::from_idx(sq)
				<< " contradicts earlier givens\n";
			return std::nullopt;
		}
	}
	logging::debug() << "load_puzzle: givens=" << givens << " solved_after_propagation="
		<< board.scan().solved_count << "\n";
	return board;
}


void print(std::ostream& os, const board_t& board)
{
	constexpr int width = 6;
	for (size_t sq = 0; sq < square_count; ++sq) {
		os << std::setw(width) << board.candidates(static_cast<square_idx_t>(sq)).to_string() << ' ';
		if (sq % N == N - 1) {
			os << '\n';
		}
	}
}


void print_detailed(std::ostream& os, const board_t& board)
{
	for (num_t row = 0; row < N; ++row) {
		if (row % Ns == 0 && row != 0) {
			os << '\n';
			print_rule(os, '=');
			os << '\n';
		} else if (row != 0) {
			print_rule(os, '-');
		}
		for (num_t digit_row = 0; digit_row < Ns; ++digit_row) {
			print_candidate_row(os, board, row, digit_row);
		}
	}
}


std::string to_line(const board_t& board)
{
	std::string line;
	line.reserve(square_count);
	for (size_t sq = 0; sq < square_count; ++sq) {
		auto const solved = board.candidates(static_cast<square_idx_t>(sq)).is_solved();
		line.push_back(solved ? num_print(solved.value()) : '.');
	}
	return line;
}

} // namespace sudoku
