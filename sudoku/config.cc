#include "config.h"

#include <ostream>
#include <stdexcept>


namespace sudoku {

namespace {

bool starts_with(const std::string& s, const std::string& prefix)
{
	return s.rfind(prefix, 0) == 0;
}

size_t parse_workers(const std::string& s)
{
	size_t pos = 0;
	unsigned long n = 0;
	try {
		n = std::stoul(s, &pos);
	} catch (const std::exception&) {
		throw std::runtime_error("Bad worker count: " + s);
	}
	if (pos != s.size() || n == 0) {
		throw std::runtime_error("Bad worker count: " + s);
	}
	return n;
}

} // namespace


config_t parse_args(const std::vector<std::string>& args)
{
	config_t cfg;
	bool have_path = false;
	for (const auto& a : args) {
		if (a == "--help" || a == "-h") {
			cfg.help = true;
		} else if (a == "--parallel") {
			cfg.parallel = true;
		} else if (starts_with(a, "--workers=")) {
			cfg.parallel = true;
			cfg.workers = parse_workers(a.substr(std::string("--workers=").size()));
		} else if (a == "--count") {
			cfg.count = true;
		} else if (a == "--detailed") {
			cfg.detailed = true;
		} else if (a == "--pause") {
			cfg.pause = true;
		} else if (a == "--verbose" || a == "-v") {
			cfg.log_level = logging::level_t::debug;
		} else if (a == "--quiet" || a == "-q") {
			cfg.log_level = logging::level_t::error;
		} else if (starts_with(a, "--log-level=")) {
			cfg.log_level = logging::level_parse(a.substr(std::string("--log-level=").size()));
		} else if (a == "-" || !starts_with(a, "-")) {
			if (have_path) {
				throw std::runtime_error("More than one puzzle file: " + a);
			}
			cfg.input_path = a;
			have_path = true;
		} else {
			throw std::runtime_error("Unknown option: " + a);
		}
	}
	return cfg;
}


config_t parse_args(int argc, const char* const* argv)
{
	std::vector<std::string> args;
	for (int i = 1; i < argc; ++i) {
		args.emplace_back(argv[i]);
	}
	return parse_args(args);
}


void usage(std::ostream& os, const char* argv0)
{
	os
		<< "Usage: " << argv0 << " [options] [puzzle_file|-]\n"
		<< "  The puzzle is 81 characters, row by row: 1-9 are givens, anything else is blank.\n"
		<< "  Line breaks count as blanks. Default file: sudoku.txt, '-' reads stdin.\n"
		<< "Options:\n"
		<< "  --parallel          search root branches on separate threads\n"
		<< "  --workers=N         at most N search threads (implies --parallel)\n"
		<< "  --count             report whether the solution is unique (sequential search)\n"
		<< "  --detailed          print the candidate map as well\n"
		<< "  --pause             wait for a key before exiting\n"
		<< "  --verbose, -v       debug logging\n"
		<< "  --quiet, -q         errors only\n"
		<< "  --log-level=LEVEL   debug, info, warning or error\n"
		<< "  --help, -h          this text\n";
}

} // namespace sudoku
