#ifndef _sudoku_board_h_included_
#define _sudoku_board_h_included_

#include "numset.h"
#include "topology.h"

#include <array>
#include <deque>
#include <optional>
#include <vector>


namespace sudoku {

// Outcome of a propagation step. no_remaining_values means the board is contradictory
// and must be discarded; it is not an error of the program.
enum class status_t { ok, no_remaining_values };

const char* to_string(status_t st);


// places in a unit which still admit a digit
struct places_t {
	enum class kind_t { one_candidate, multiple_candidates };
	kind_t kind;
	std::vector<square_idx_t> squares; // ascending; exactly one for one_candidate

	square_idx_t single() const { assert(kind == kind_t::one_candidate); return squares.front(); }
};


// result of the whole-board fold used by the search
struct scan_t {
	enum class state_t { solved, unsolved, contradiction };
	state_t state;
	size_t solved_count = 0;   // squares with a single candidate
	size_t min_count = N;      // smallest candidate count above one (unsolved only)
	square_idx_t branch = 0;   // first square with min_count candidates (unsolved only)
};


// One point of the search space: the candidate set of every square.
// Cheap to copy; search branches copy it before narrowing.
class board_t {
public:
	explicit board_t(const topology_t& topology = topology_t::instance());

	const topology_t& topology() const { return *topology_; }

	const numset_t& candidates(square_idx_t sq) const { return cells_.at(sq); }
	const numset_t& candidates(const square_t& sq) const { return candidates(sq.idx()); }

	// leave only `num` in `sq`
	status_t assign(square_idx_t sq, num_t num);
	// drop `num` from `sq` and propagate the consequences
	status_t eliminate(square_idx_t sq, num_t num);

	// std::nullopt means no square of the unit admits `num` (no_remaining_values)
	std::optional<places_t> count_places_for_value(unit_idx_t u, num_t num) const;

	scan_t scan() const;
	bool is_solved() const { return scan().state == scan_t::state_t::solved; }

	// every unit holds each digit exactly once; independent of propagation
	bool verify() const;

private:
	struct elimination_t {
		square_idx_t sq;
		num_t num;
	};
	using work_queue_t = std::deque<elimination_t>;

	void enqueue_assign(work_queue_t& queue, square_idx_t sq, num_t num) const;
	status_t propagate(work_queue_t& queue);

	const topology_t* topology_;
	std::array<numset_t, square_count> cells_;
};

} // namespace sudoku

#endif
