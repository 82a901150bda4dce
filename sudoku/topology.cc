#include "topology.h"

#include <ostream>


namespace sudoku {

std::ostream& operator<<(std::ostream& os, const square_t& sq)
{
	return os << static_cast<char>('A' + sq.row) << static_cast<char>('1' + sq.col);
}


const char* to_string(unit_kind_t kind)
{
	switch (kind) {
		case unit_kind_t::row:
			return "row";
		case unit_kind_t::column:
			return "column";
		case unit_kind_t::box:
			return "box";
	}
	return "?";
}


topology_t::topology_t()
{
	// rows, then columns, then boxes (left to right, top to bottom)
	for (num_t idx = 0; idx < N; ++idx) {
		auto& row = units_.at(row_unit(idx));
		auto& col = units_.at(column_unit(idx));
		for (num_t k = 0; k < N; ++k) {
			row.at(k) = square_t(idx, k).idx();
			col.at(k) = square_t(k, idx).idx();
		}
	}
	for (num_t r = 0; r < N; r += Ns) {
		for (num_t c = 0; c < N; c += Ns) {
			auto& box = units_.at(box_unit(square_t(r, c).box()));
			size_t k = 0;
			for (num_t rr = r; rr < r + Ns; ++rr) {
				for (num_t cc = c; cc < c + Ns; ++cc) {
					box.at(k++) = square_t(rr, cc).idx();
				}
			}
			assert(k == N);
		}
	}

	// unit indexes grow row -> column -> box, so units_of() keeps that order
	std::array<size_t, square_count> filled{};
	for (size_t u = 0; u < unit_count; ++u) {
		for (const square_idx_t sq : units_.at(u)) {
			units_of_.at(sq).at(filled.at(sq)++) = static_cast<unit_idx_t>(u);
		}
	}

	for (size_t sq = 0; sq < square_count; ++sq) {
		assert(filled.at(sq) == units_per_square);
		auto& peers = peers_.at(sq);
		peers.reserve(peer_count);
		for (const unit_idx_t u : units_of_.at(sq)) {
			for (const square_idx_t other : units_.at(u)) {
				if (other != sq) {
					peers.insert(other);
				}
			}
		}
		assert(peers.size() == peer_count);
	}
}


const topology_t& topology_t::instance()
{
	static const topology_t topology;
	return topology;
}


unit_kind_t topology_t::unit_kind(unit_idx_t u) const
{
	assert(u < unit_count);
	if (u < N) {
		return unit_kind_t::row;
	}
	if (u < 2 * N) {
		return unit_kind_t::column;
	}
	return unit_kind_t::box;
}

} // namespace sudoku
