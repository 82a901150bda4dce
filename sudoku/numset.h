#ifndef _sudoku_numset_h_included_
#define _sudoku_numset_h_included_

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <assert.h>


namespace sudoku {

using num_t = uint8_t; // internal digit, 0..8 means '1'..'9'

constexpr num_t N = 9;
constexpr num_t Ns = 3; // box side

using bitset_t = std::bitset<N>;


inline bool num_is_digit(char c)
{
	return c >= '1' && c <= '9';
}

inline num_t num_parse(char c)
{
	if (num_is_digit(c))
		return c - '0' - 1;
	throw std::runtime_error("Num[1..9] parsing error");
}

inline char num_print(num_t n)
{
	assert(n < N);
	return '0' + n + 1;
}


// candidate digits of one square
class numset_t {
	bitset_t bits_;
public:
	numset_t() { bits_.set(); }
	explicit numset_t(const bitset_t& bits) : bits_(bits) {}

	static numset_t make_solved(num_t num)
	{
		numset_t r;
		r.assign(num);
		return r;
	}

	void assign(num_t num)
	{
		bits_.reset();
		bits_.set(num);
	}

	bool operator==(const numset_t& other) const { return bits_ == other.bits_; }
	bool operator!=(const numset_t& other) const { return bits_ != other.bits_; }

	size_t count() const { return bits_.count(); }
	bool empty() const { return bits_.none(); }
	bool full() const { return bits_.all(); }

	bool has(num_t n) const
	{
		return bits_.test(n);
	}

	bool try_exclude(num_t n)
	{
		if (bits_.test(n)) {
			bits_.reset(n);
			return true;
		}
		return false;
	}

	std::optional<num_t> is_solved() const
	{
		if (bits_.count() != 1) {
			return std::nullopt;
		}
		for (num_t n = 0; n < N; ++n) {
			if (bits_.test(n)) {
				return n;
			}
		}
		return std::nullopt;
	}

	// ascending digits, e.g. "1379"
	std::string to_string() const
	{
		std::string s;
		for (num_t n = 0; n < N; ++n) {
			if (bits_.test(n)) {
				s.push_back(num_print(n));
			}
		}
		return s;
	}

	const bitset_t& bits() const { return bits_; }
};

} // namespace sudoku

#endif
