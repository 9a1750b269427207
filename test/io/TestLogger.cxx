// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "io/Logger.hxx"
#include "io/Open.hxx"
#include "io/StringFile.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

/**
 * Redirects the log to a file for the duration of a test.
 */
class LogFileTest : public ::testing::Test {
protected:
	TempDirectory dir;
	std::string path = dir.Path("test.log");

	void SetUp() override {
		SetLogLevel(3);
		SetLogFile(OpenAppend(path.c_str()));
	}

	void TearDown() override {
		SetLogFile(UniqueFileDescriptor{});
		SetLogLevel(1);
	}

	std::vector<std::string> ReadLines() const {
		const auto contents = LoadStringFile(path.c_str());

		std::vector<std::string> lines;
		std::size_t start = 0;
		for (std::size_t i; (i = contents.find('\n', start)) != contents.npos;
		     start = i + 1)
			lines.emplace_back(contents, start, i - start);
		return lines;
	}

	/**
	 * Strip the timestamp from a log line.
	 */
	static std::string_view WithoutTimestamp(std::string_view line) noexcept {
		const auto space = line.find(' ');
		return space == line.npos ? line : line.substr(space + 1);
	}
};

TEST_F(LogFileTest, Levels)
{
	const LLogger logger("test"sv);

	logger(1, "first ", 1U);
	logger(3, "second");
	logger(4, "not logged");
	logger.Fmt(2, "third {} {}"sv, 3, "x");

	const auto lines = ReadLines();
	ASSERT_EQ(lines.size(), 3U);
	EXPECT_EQ(WithoutTimestamp(lines[0]), "error [test] first 1"sv);
	EXPECT_EQ(WithoutTimestamp(lines[1]), "info [test] second"sv);
	EXPECT_EQ(WithoutTimestamp(lines[2]), "warning [test] third 3 x"sv);
}

TEST_F(LogFileTest, Exception)
{
	LogConcat(1, "main"sv,
		  std::make_exception_ptr(std::runtime_error("Failed")));

	const auto lines = ReadLines();
	ASSERT_EQ(lines.size(), 1U);
	EXPECT_EQ(WithoutTimestamp(lines[0]), "error [main] Failed"sv);
}

TEST(LoggerTest, CheckLevel)
{
	SetLogLevel(3);
	EXPECT_TRUE(CheckLogLevel(1));
	EXPECT_TRUE(CheckLogLevel(3));
	EXPECT_FALSE(CheckLogLevel(4));
	SetLogLevel(1);
}

TEST(LoggerTest, LevelName)
{
	EXPECT_EQ(GetLogLevelName(1), "error"sv);
	EXPECT_EQ(GetLogLevelName(2), "warning"sv);
	EXPECT_EQ(GetLogLevelName(3), "info"sv);
	EXPECT_EQ(GetLogLevelName(5), "debug"sv);
}
