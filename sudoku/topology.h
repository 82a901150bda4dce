#ifndef _sudoku_topology_h_included_
#define _sudoku_topology_h_included_

#include "numset.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>

#include <boost/container/flat_set.hpp>


namespace sudoku {

using square_idx_t = uint8_t; // row * N + col
using unit_idx_t = uint8_t;

constexpr size_t square_count = N * N;
constexpr size_t unit_count = 3 * N;
constexpr size_t units_per_square = 3;
constexpr size_t peer_count = 2 * (N - 1) + (Ns - 1) * (Ns - 1);


struct square_t {
	num_t row;
	num_t col;

	square_t(num_t r, num_t c) : row(r), col(c) { assert(r < N && c < N); }

	static square_t from_idx(square_idx_t idx) { return square_t(idx / N, idx % N); }
	square_idx_t idx() const { return row * N + col; }
	num_t box() const { return (row / Ns) * Ns + col / Ns; }

	bool operator==(const square_t& other) const { return row == other.row && col == other.col; }
	bool operator!=(const square_t& other) const { return !(*this == other); }
	bool operator<(const square_t& other) const
	{
		if (row == other.row) {
			return col < other.col;
		}
		return row < other.row;
	}
};

// "A1".."I9"
std::ostream& operator<<(std::ostream& os, const square_t& sq);


enum class unit_kind_t { row, column, box };

const char* to_string(unit_kind_t kind);

using unit_t = std::array<square_idx_t, N>;
using unit_refs_t = std::array<unit_idx_t, units_per_square>;
using peers_t = boost::container::flat_set<square_idx_t>;


// Static structure of the board: 27 units, and per square its 3 units and 20 peers.
// Immutable after construction, so one instance is shared by every board_t.
class topology_t {
public:
	topology_t();

	// process-wide instance, built on first use
	static const topology_t& instance();

	const std::array<unit_t, unit_count>& units() const { return units_; }
	const unit_t& unit(unit_idx_t u) const { return units_.at(u); }
	unit_kind_t unit_kind(unit_idx_t u) const;

	const unit_refs_t& units_of(square_idx_t sq) const { return units_of_.at(sq); }
	const peers_t& peers_of(square_idx_t sq) const { return peers_.at(sq); }

	static unit_idx_t row_unit(num_t row) { return row; }
	static unit_idx_t column_unit(num_t col) { return N + col; }
	static unit_idx_t box_unit(num_t box) { return 2 * N + box; }

private:
	std::array<unit_t, unit_count> units_;
	std::array<unit_refs_t, square_count> units_of_;
	std::array<peers_t, square_count> peers_;
};

} // namespace sudoku

#endif
