#include "logging.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>


namespace logging {

namespace {
	std::atomic<level_t> g_level{level_t::info};
	std::ostream* g_stream = &std::clog;
	std::mutex g_mutex;
}


const char* to_string(level_t level)
{
	switch (level) {
		case level_t::debug:
			return "DEBUG";
		case level_t::info:
			return "INFO";
		case level_t::warning:
			return "WARNING";
		case level_t::error:
			return "ERROR";
	}
	return "?";
}

level_t level_parse(const std::string& s)
{
	if (s == "debug")
		return level_t::debug;
	if (s == "info")
		return level_t::info;
	if (s == "warning")
		return level_t::warning;
	if (s == "error")
		return level_t::error;
	throw std::runtime_error("Unknown log level: " + s);
}

void set_level(level_t level)
{
	g_level = level;
}

level_t get_level()
{
	return g_level;
}

bool enabled(level_t level)
{
	return static_cast<int>(level) >= static_cast<int>(g_level.load());
}

void set_stream(std::ostream& os)
{
	std::lock_guard<std::mutex> lock(g_mutex);
	g_stream = &os;
}


line_t::line_t(level_t level)
	: level_(level)
	, enabled_(enabled(level))
{
}

line_t::~line_t()
{
	if (!enabled_) {
		return;
	}
	std::lock_guard<std::mutex> lock(g_mutex);
	*g_stream << to_string(level_) << ": " << os_str_.str() << std::flush;
}

} // namespace logging
