/*
 * Unit tests for src/library_logger.cpp
 */

#include "library_logger.hpp"

#include <fstream>
#include <iterator>
#include <string>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/common.h>

using namespace zonedisc;

namespace {

std::string
ReadFile(const std::string &path)
{
	std::ifstream in(path);
	return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::string
TempPath(const char *name)
{
	return testing::TempDir() + name;
}

/**
 * Leaves the library loggers silent for the other suites.
 */
class LibraryLogger : public testing::Test {
protected:
	void TearDown() override {
		library_logger::options opt;
		opt._level = spdlog::level::off;
		opt._file = TempPath("zonedisc_logger_off.log");
		library_logger::init(opt);
	}
};

} // namespace

TEST_F(LibraryLogger, LevelAndFile)
{
	const auto path = TempPath("zonedisc_logger_debug.log");

	library_logger::options opt;
	opt._level = spdlog::level::debug;
	opt._file = path;
	library_logger::init(opt);

	EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);

	auto logger = library_logger::create_logger("t");
	EXPECT_EQ(logger->level(), spdlog::level::debug);
	logger->debug("answer from {}", "10.0.0.7");
	logger->trace("below the level");

	const auto text = ReadFile(path);
	EXPECT_NE(text.find("answer from 10.0.0.7"), std::string::npos);
	EXPECT_NE(text.find("logging at level debug"), std::string::npos);
	EXPECT_EQ(text.find("below the level"), std::string::npos);
}

TEST_F(LibraryLogger, Off)
{
	const auto path = TempPath("zonedisc_logger_silent.log");

	library_logger::options opt;
	opt._level = spdlog::level::off;
	opt._file = path;
	library_logger::init(opt);

	library_logger::create_logger("t")->error("not written");

	EXPECT_EQ(ReadFile(path), "");
}

TEST_F(LibraryLogger, FileCannotBeOpened)
{
	/* a regular file cannot be a directory of the log path */
	const auto blocker = TempPath("zonedisc_logger_blocker");
	std::ofstream(blocker) << "x";

	library_logger::options opt;
	opt._level = spdlog::level::info;
	opt._file = blocker + "/zonedisc.log";
	EXPECT_THROW(library_logger::init(opt), spdlog::spdlog_ex);
}

TEST(LibraryLoggerDefaults, DefaultFile)
{
	const auto path = library_logger::default_file();
	const std::string suffix = "zonedisc.log";
	ASSERT_GE(path.size(), suffix.size());
	EXPECT_EQ(path.substr(path.size() - suffix.size()), suffix);
}
