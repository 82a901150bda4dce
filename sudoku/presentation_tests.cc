#define BOOST_TEST_MODULE presentation_tests
#include <boost/test/included/unit_test.hpp>

#include "presentation.h"
#include "search.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace sudoku;

namespace {

const std::string easy_puzzle =
	"003020600900305001001806400008102900700000008006708200002609500800203009005010300";
const std::string solved_grid =
	"483921657967345821251876493548132976729564138136798245372689514814253769695417382";

board_t solved_board()
{
	auto const board = load_puzzle(solved_grid);
	BOOST_REQUIRE(board.has_value());
	return *board;
}

}


BOOST_AUTO_TEST_CASE(test_read_takes_raw_characters)
{
	std::istringstream is(solved_grid.substr(0, 9) + "\n" + solved_grid.substr(9) + "trailing text");
	auto const puzzle = read_puzzle(is);
	BOOST_TEST(puzzle.size() == square_count);
	BOOST_TEST(puzzle.substr(0, 9) == solved_grid.substr(0, 9));
	// a line break inside the grid is a blank, not skipped
	BOOST_TEST(puzzle.at(9) == '\n');
	BOOST_TEST(puzzle.substr(10) == solved_grid.substr(9, 71));
}

BOOST_AUTO_TEST_CASE(test_space_blanks)
{
	std::string puzzle = easy_puzzle;
	std::replace(puzzle.begin(), puzzle.end(), '0', ' ');
	BOOST_TEST(puzzle.size() == square_count);

	auto const board = load_puzzle(puzzle);
	BOOST_TEST(board.has_value());
	auto const solved = search(*board);
	BOOST_TEST(solved.has_value());
	BOOST_TEST(to_line(*solved) == solved_grid);

	std::istringstream is(puzzle + "\n");
	BOOST_TEST(read_puzzle(is) == puzzle);
}

BOOST_AUTO_TEST_CASE(test_read_too_short)
{
	std::istringstream is("123456789\n123");
	BOOST_CHECK_THROW(read_puzzle(is), std::runtime_error);
	BOOST_CHECK_THROW(load_puzzle(std::string(80, '.')), std::runtime_error);
	BOOST_CHECK_THROW(load_puzzle(std::string(80, ' ')), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_read_file)
{
	const std::string path = "presentation_tests_puzzle.txt";
	{
		std::ofstream os(path);
		os << solved_grid << "\n";
	}
	BOOST_TEST(read_puzzle_file(path) == solved_grid);
	std::remove(path.c_str());

	BOOST_CHECK_THROW(read_puzzle_file("no/such/puzzle.txt"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_blank_characters)
{
	// anything that is not 1..9 is a blank
	std::string puzzle = solved_grid;
	puzzle.at(0) = '0';
	puzzle.at(1) = '.';
	puzzle.at(2) = '*';
	puzzle.at(3) = 'x';
	puzzle.at(4) = ' ';
	auto const board = load_puzzle(puzzle);
	BOOST_TEST(board.has_value());
	// the givens fix the five blanks by propagation alone
	BOOST_TEST(to_line(*board) == solved_grid);

	auto const empty = load_puzzle(std::string(square_count, '_'));
	BOOST_TEST(empty.has_value());
	BOOST_TEST(empty->scan().solved_count == 0u);
}

BOOST_AUTO_TEST_CASE(test_load_keeps_givens)
{
	std::string puzzle(square_count, '.');
	puzzle.at(square_t(1, 2).idx()) = '5';
	puzzle.at(square_t(7, 7).idx()) = '3';
	auto const board = load_puzzle(puzzle);
	BOOST_TEST(board.has_value());
	BOOST_TEST(board->candidates(square_t(1, 2)).to_string() == "5");
	BOOST_TEST(board->candidates(square_t(7, 7)).to_string() == "3");
	BOOST_TEST(board->candidates(square_t(1, 0)).to_string() == "12346789");
	BOOST_TEST(board->candidates(square_t(7, 2)).to_string() == "1246789");
	BOOST_TEST(board->candidates(square_t(7, 0)).to_string() == "12456789");
}

BOOST_AUTO_TEST_CASE(test_load_contradiction)
{
	std::string puzzle(square_count, '.');
	puzzle.at(square_t(0, 0).idx()) = '4';
	puzzle.at(square_t(1, 1).idx()) = '4';
	BOOST_TEST(!load_puzzle(puzzle).has_value());
}

BOOST_AUTO_TEST_CASE(test_print_solved)
{
	std::ostringstream os;
	print(os, solved_board());
	const std::string out = os.str();

	BOOST_TEST(std::count(out.begin(), out.end(), '\n') == 9);
	const std::string first = out.substr(0, out.find('\n'));
	BOOST_TEST(first == "     4      8      3      9      2      1      6      5      7 ");
	const std::string last = out.substr(out.rfind('\n', out.size() - 2) + 1);
	BOOST_TEST(last == "     6      9      5      4      1      7      3      8      2 \n");
}

BOOST_AUTO_TEST_CASE(test_print_candidates)
{
	std::string puzzle(square_count, '.');
	puzzle.at(0) = '1';
	auto const board = load_puzzle(puzzle);
	std::ostringstream os;
	print(os, *board);
	const std::string first = os.str().substr(0, os.str().find('\n'));
	// wide candidate sets are not truncated
	BOOST_TEST(first.substr(0, 7) == "     1 ");
	BOOST_TEST(first.substr(7, 9) == "23456789 ");
}

BOOST_AUTO_TEST_CASE(test_print_detailed)
{
	std::ostringstream os;
	print_detailed(os, board_t());
	const std::string out = os.str();
	// 27 candidate rows, 6 thin and 2 thick separators
	BOOST_TEST(std::count(out.begin(), out.end(), '\n') == 27 + 6 + 2 * 3);
	BOOST_TEST(out.substr(0, out.find('\n')) ==
		" 123 | 123 | 123  |||  123 | 123 | 123  |||  123 | 123 | 123");

	std::ostringstream os_solved;
	print_detailed(os_solved, solved_board());
	// '4' is the fourth digit: second candidate row, first column
	std::istringstream is(os_solved.str());
	std::string line;
	std::getline(is, line);
	std::getline(is, line);
	BOOST_TEST(line.substr(0, 4) == " 4  ");
}

BOOST_AUTO_TEST_CASE(test_to_line)
{
	BOOST_TEST(to_line(board_t()) == std::string(square_count, '.'));
	BOOST_TEST(to_line(solved_board()) == solved_grid);
}
