#ifndef _sudoku_search_h_included_
#define _sudoku_search_h_included_

#include "board.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>


namespace sudoku {

struct search_stats_t {
	size_t nodes = 0;
	size_t contradictions = 0; // branches dropped because assign failed or scan found an empty set
	size_t solutions = 0;
	size_t max_depth = 0;

	search_stats_t& operator+=(const search_stats_t& other);
};

std::ostream& operator<<(std::ostream& os, const search_stats_t& stats);


// Called for every solution found; return false to stop the search.
using solution_visitor_t = std::function<bool(const board_t&)>;


// Depth-first search, branching on the first square with the fewest candidates,
// digits in ascending order. Returns the first solution found.
std::optional<board_t> search(const board_t& board, search_stats_t* stats = nullptr);

// Same order as search(), but continues after a solution while the visitor returns true.
// `cancel` is polled at every node; when it becomes true the search unwinds.
void search_all(
	const board_t& board,
	const solution_visitor_t& visitor,
	search_stats_t* stats = nullptr,
	const std::atomic<bool>* cancel = nullptr
);

// Number of solutions, counting stops at `limit`.
size_t count_solutions(const board_t& board, size_t limit, search_stats_t* stats = nullptr);

// Branches of the root node run on separate tasks (at most `workers` at a time).
// The first solution found cancels the others. With several solutions the result
// may differ from search().
std::optional<board_t> search_parallel(const board_t& board, size_t workers, search_stats_t* stats = nullptr);

} // namespace sudoku

#endif
