#include "board.h"

#include "logging.h"


namespace sudoku {

const char* to_string(status_t st)
{
	switch (st) {
		case status_t::ok:
			return "ok";
		case status_t::no_remaining_values:
			return "no_remaining_values";
	}
	return "?";
}


board_t::board_t(const topology_t& topology)
	: topology_(&topology)
{
	// numset_t is "full" by default
}


status_t board_t::assign(square_idx_t sq, num_t num)
{
	work_queue_t queue;
	enqueue_assign(queue, sq, num);
	return propagate(queue);
}


status_t board_t::eliminate(square_idx_t sq, num_t num)
{
	work_queue_t queue;
	queue.push_back(elimination_t{sq, num});
	return propagate(queue);
}


void board_t::enqueue_assign(work_queue_t& queue, square_idx_t sq, num_t num) const
{
	const auto& cell = cells_.at(sq);
	for (num_t n = 0; n < N; ++n) {
		if (n != num && cell.has(n)) {
			queue.push_back(elimination_t{sq, n});
		}
	}
}


// Drains elimination obligations until a fixed point or the first contradiction.
// Candidates only ever shrink, so the order of obligations does not change the result.
status_t board_t::propagate(work_queue_t& queue)
{
	while (!queue.empty()) {
		auto const e = queue.front();
		queue.pop_front();

		auto& cell = cells_.at(e.sq);
		if (!cell.try_exclude(e.num)) {
			continue;
		}
		if (cell.empty()) {
			return status_t::no_remaining_values;
		}

		// a solved square forbids its digit in all its peers
		if (auto const last = cell.is_solved()) {
			for (const square_idx_t peer : topology_->peers_of(e.sq)) {
				if (cells_.at(peer).has(last.value())) {
					queue.push_back(elimination_t{peer, last.value()});
				}
			}
		}

		// a unit with a single place left for the digit puts it there
		for (const unit_idx_t u : topology_->units_of(e.sq)) {
			auto const places = count_places_for_value(u, e.num);
			if (!places) {
				return status_t::no_remaining_values;
			}
			if (places->kind == places_t::kind_t::one_candidate) {
				enqueue_assign(queue, places->single(), e.num);
			}
		}
	}
	return status_t::ok;
}


std::optional<places_t> board_t::count_places_for_value(unit_idx_t u, num_t num) const
{
	places_t places{places_t::kind_t::multiple_candidates, {}};
	for (const square_idx_t sq : topology_->unit(u)) {
		if (cells_.at(sq).has(num)) {
			places.squares.push_back(sq);
		}
	}

	switch (places.squares.size()) {
		case 0:
			return std::nullopt;
		case 1:
			places.kind = places_t::kind_t::one_candidate;
			return places;
		default:
			return places;
	}
}


scan_t board_t::scan() const
{
	scan_t r{scan_t::state_t::unsolved};
	r.min_count = N + 1;
	for (size_t sq = 0; sq < square_count; ++sq) {
		auto const count = cells_.at(sq).count();
		if (count == 0) {
			r.state = scan_t::state_t::contradiction;
			r.branch = static_cast<square_idx_t>(sq);
			return r;
		}
		if (count == 1) {
			++r.solved_count;
		} else if (count < r.min_count) {
			r.min_count = count;
			r.branch = static_cast<square_idx_t>(sq);
		}
	}
	if (r.solved_count == square_count) {
		r.state = scan_t::state_t::solved;
	}
	return r;
}


bool board_t::verify() const
{
	bool verified = true;
	for (size_t u = 0; u < unit_count; ++u) {
		bitset_t nums;
		for (const square_idx_t sq : topology_->unit(u)) {
			auto const& cell = cells_.at(sq);
			if (!cell.is_solved()) {
				logging::debug() << "verify: unsolved square " << square_t::from_idx(sq) << "\n";
				return false;
			}
			nums |= cell.bits();
		}
		// nine singletons covering nine digits means no digit repeats
		if (!nums.all()) {
			logging::debug() << "verify: " << to_string(topology_->unit_kind(u))
				<< " unit " << u << " has digits " << nums.to_string() << "\n";
			verified = false;
		}
	}
	return verified;
}

} // namespace sudoku
