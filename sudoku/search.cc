#include "search.h"

#include "logging.h"

#include <algorithm>
#include <chrono>
#include <deque>
#include <future>
#include <ostream>
#include <utility>
#include <vector>


namespace sudoku {

search_stats_t& search_stats_t::operator+=(const search_stats_t& other)
{
	nodes += other.nodes;
	contradictions += other.contradictions;
	solutions += other.solutions;
	max_depth = std::max(max_depth, other.max_depth);
	return *this;
}

std::ostream& operator<<(std::ostream& os, const search_stats_t& stats)
{
	return os << "nodes=" << stats.nodes
		<< " contradictions=" << stats.contradictions
		<< " solutions=" << stats.solutions
		<< " max_depth=" << stats.max_depth;
}


namespace {

// returns false when the whole search has to stop
bool search_impl(
	const board_t& board,
	const solution_visitor_t& visitor,
	search_stats_t& stats,
	const std::atomic<bool>* cancel,
	size_t depth
)
{
	if (cancel && cancel->load()) {
		return false;
	}

	++stats.nodes;
	stats.max_depth = std::max(stats.max_depth, depth);

	auto const sc = board.scan();
	switch (sc.state) {
		case scan_t::state_t::contradiction:
			++stats.contradictions;
			return true;
		case scan_t::state_t::solved:
			++stats.solutions;
			return visitor(board);
		case scan_t::state_t::unsolved:
			break;
	}

	auto const& cands = board.candidates(sc.branch);
	for (num_t n = 0; n < N; ++n) {
		if (!cands.has(n)) {
			continue;
		}
		board_t branch(board);
		if (branch.assign(sc.branch, n) != status_t::ok) {
			++stats.contradictions;
			continue;
		}
		if (!search_impl(branch, visitor, stats, cancel, depth + 1)) {
			return false;
		}
	}
	return true;
}

} // namespace


void search_all(
	const board_t& board,
	const solution_visitor_t& visitor,
	search_stats_t* stats,
	const std::atomic<bool>* cancel
)
{
	search_stats_t local;
	search_impl(board, visitor, local, cancel, 0);
	if (stats) {
		*stats += local;
	}
}


std::optional<board_t> search(const board_t& board, search_stats_t* stats)
{
	std::optional<board_t> result;
	search_all(
		board,
		[&result](const board_t& solved) {
			result = solved;
			return false;
		},
		stats
	);
	return result;
}


size_t count_solutions(const board_t& board, size_t limit, search_stats_t* stats)
{
	size_t count = 0;
	if (limit == 0) {
		return count;
	}
	search_all(
		board,
		[&count, limit](const board_t&) {
			++count;
			return count < limit;
		},
		stats
	);
	return count;
}


std::optional<board_t> search_parallel(const board_t& board, size_t workers, search_stats_t* stats)
{
	auto const sc = board.scan();
	if (workers <= 1 || sc.state != scan_t::state_t::unsolved) {
		return search(board, stats);
	}

	search_stats_t total;
	++total.nodes;

	// root branches, each one owned by exactly one task
	std::deque<board_t> pending;
	auto const& cands = board.candidates(sc.branch);
	for (num_t n = 0; n < N; ++n) {
		if (!cands.has(n)) {
			continue;
		}
		board_t branch(board);
		if (branch.assign(sc.branch, n) != status_t::ok) {
			++total.contradictions;
			continue;
		}
		pending.push_back(std::move(branch));
	}

	struct task_result_t {
		std::optional<board_t> solution;
		search_stats_t stats;
	};

	std::atomic<bool> cancel{false};
	auto run_branch = [&cancel](const board_t branch) {
		task_result_t r;
		search_all(
			branch,
			[&r](const board_t& solved) {
				r.solution = solved;
				return false;
			},
			&r.stats,
			&cancel
		);
		if (r.solution) {
			cancel = true;
		}
		++r.stats.max_depth; // depth was counted from the branch, not from the root
		return r;
	};

	logging::debug() << "search_parallel: branch=" << square_t::from_idx(sc.branch)
		<< " tasks=" << pending.size() << " workers=" << workers << "\n";

	std::optional<board_t> solution;
	std::vector< std::future<task_result_t> > fut;
	const auto tm = std::chrono::milliseconds(10);
	while (!solution && (!pending.empty() || !fut.empty())) {
		while (fut.size() < workers && !pending.empty()) {
			fut.emplace_back(std::async(std::launch::async, run_branch, std::move(pending.front())));
			pending.pop_front();
		}

		auto iter = fut.begin();
		while (iter != fut.end()) {
			if (iter->wait_for(tm) == std::future_status::timeout) {
				++iter;
				continue;
			}
			task_result_t r = iter->get();
			iter = fut.erase(iter);
			total += r.stats;
			if (r.solution && !solution) {
				solution = std::move(r.solution);
				cancel = true;
			}
		}
	}

	// cancelled siblings finish their current node and return
	for (auto& f : fut) {
		total += f.get().stats;
	}

	if (stats) {
		*stats += total;
	}
	return solution;
}

} // namespace sudoku
