#ifndef _sudoku_logging_h_included_
#define _sudoku_logging_h_included_

#include <iosfwd>
#include <sstream>
#include <string>


namespace logging {

enum class level_t { debug, info, warning, error };

const char* to_string(level_t level);
level_t level_parse(const std::string& s); // throws std::runtime_error

void set_level(level_t level);
level_t get_level();
bool enabled(level_t level);

// default is std::clog; tests redirect to a string stream
void set_stream(std::ostream& os);


// One log line. Text is collected locally and written in one piece on destruction,
// so lines from parallel search workers do not interleave.
class line_t {
	std::ostringstream os_str_;
	const level_t level_;
	const bool enabled_;
public:
	explicit line_t(level_t level);
	line_t(const line_t&) = delete;
	line_t& operator=(const line_t&) = delete;
	~line_t();

	template <typename T>
	line_t& operator<<(const T& t)
	{
		if (enabled_) {
			os_str_ << t;
		}
		return *this;
	}
};

inline line_t debug() { return line_t(level_t::debug); }
inline line_t info() { return line_t(level_t::info); }
inline line_t warning() { return line_t(level_t::warning); }
inline line_t error() { return line_t(level_t::error); }

} // namespace logging

#endif
