#define BOOST_TEST_MODULE config_tests
#include <boost/test/included/unit_test.hpp>

#include "config.h"
#include "logging.h"

#include <iostream>
#include <sstream>

using namespace sudoku;

BOOST_AUTO_TEST_CASE(test_defaults)
{
	auto const cfg = parse_args({});
	BOOST_TEST(cfg.input_path == "sudoku.txt");
	BOOST_TEST(!cfg.parallel);
	BOOST_TEST(cfg.workers == 0u);
	BOOST_TEST(!cfg.count);
	BOOST_TEST(!cfg.detailed);
	BOOST_TEST(!cfg.pause);
	BOOST_TEST(!cfg.help);
	BOOST_TEST((cfg.log_level == logging::level_t::info));
}

BOOST_AUTO_TEST_CASE(test_options)
{
	auto const cfg = parse_args({"--count", "puzzle.txt", "--detailed", "--pause", "-v"});
	BOOST_TEST(cfg.input_path == "puzzle.txt");
	BOOST_TEST(cfg.count);
	BOOST_TEST(cfg.detailed);
	BOOST_TEST(cfg.pause);
	BOOST_TEST((cfg.log_level == logging::level_t::debug));

	BOOST_TEST(parse_args({"-"}).input_path == "-");
	BOOST_TEST((parse_args({"--quiet"}).log_level == logging::level_t::error));
	BOOST_TEST((parse_args({"--log-level=warning"}).log_level == logging::level_t::warning));
	BOOST_TEST(parse_args({"-h"}).help);
}

BOOST_AUTO_TEST_CASE(test_parallel_options)
{
	BOOST_TEST(parse_args({"--parallel"}).parallel);
	BOOST_TEST(parse_args({"--parallel"}).workers == 0u);

	auto const cfg = parse_args({"--workers=6"});
	BOOST_TEST(cfg.parallel);
	BOOST_TEST(cfg.workers == 6u);
}

BOOST_AUTO_TEST_CASE(test_bad_arguments)
{
	BOOST_CHECK_THROW(parse_args({"--fast"}), std::runtime_error);
	BOOST_CHECK_THROW(parse_args({"a.txt", "b.txt"}), std::runtime_error);
	BOOST_CHECK_THROW(parse_args({"--workers=0"}), std::runtime_error);
	BOOST_CHECK_THROW(parse_args({"--workers=two"}), std::runtime_error);
	BOOST_CHECK_THROW(parse_args({"--workers=4x"}), std::runtime_error);
	BOOST_CHECK_THROW(parse_args({"--log-level=loud"}), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_argv)
{
	const char* argv[] = {"sudoku_solve", "--count", "grid.txt"};
	auto const cfg = parse_args(3, argv);
	BOOST_TEST(cfg.count);
	BOOST_TEST(cfg.input_path == "grid.txt");
}

BOOST_AUTO_TEST_CASE(test_usage)
{
	std::ostringstream os;
	usage(os, "sudoku_solve");
	BOOST_TEST(os.str().find("Usage: sudoku_solve") == 0u);
	BOOST_TEST(os.str().find("--parallel") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_logging_threshold)
{
	std::ostringstream os;
	logging::set_stream(os);

	logging::set_level(logging::level_t::info);
	logging::debug() << "hidden " << 1 << "\n";
	logging::info() << "shown " << 2 << "\n";
	logging::error() << "also shown\n";
	BOOST_TEST(os.str() == "INFO: shown 2\nERROR: also shown\n");

	os.str("");
	logging::set_level(logging::level_t::debug);
	BOOST_TEST(logging::enabled(logging::level_t::debug));
	logging::debug() << "now visible\n";
	BOOST_TEST(os.str() == "DEBUG: now visible\n");

	logging::set_level(logging::level_t::error);
	BOOST_TEST(!logging::enabled(logging::level_t::warning));
	BOOST_TEST((logging::get_level() == logging::level_t::error));

	logging::set_level(logging::level_t::info);
	logging::set_stream(std::clog);
}
