// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "scrub/Scanner.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using std::string_view_literals::operator""sv;
using namespace Scrub;

/**
 * Returns the spans of all candidates.
 */
static std::vector<std::string>
ScanSpans(const AddressPattern &pattern, std::string_view text)
{
	std::vector<std::string> result;
	for (const auto &i : pattern.Scan(text))
		result.emplace_back(i.span);
	return result;
}

using Spans = std::vector<std::string>;

TEST(ScannerTest, IPv4)
{
	const AddressPattern pattern;

	EXPECT_EQ(ScanSpans(pattern, "1.2.3.4"sv), Spans{"1.2.3.4"});
	EXPECT_EQ(ScanSpans(pattern, "from 192.168.1.1 and 10.0.0.255."sv),
		  (Spans{"192.168.1.1", "10.0.0.255"}));

	/* octet values are not checked */
	EXPECT_EQ(ScanSpans(pattern, "999.999.999.999"sv),
		  Spans{"999.999.999.999"});

	EXPECT_TRUE(ScanSpans(pattern, "1.2.3"sv).empty());
	EXPECT_TRUE(ScanSpans(pattern, "1.2.3.4567"sv).empty());
	EXPECT_TRUE(ScanSpans(pattern, "1234.2.3.4"sv).empty());
	EXPECT_TRUE(ScanSpans(pattern, "version1.2.3.4"sv).empty());
	EXPECT_TRUE(ScanSpans(pattern, "1.2.3.4x"sv).empty());
}

TEST(ScannerTest, IPv6)
{
	const AddressPattern pattern;

	EXPECT_EQ(ScanSpans(pattern, "2001:db8:85a3:0:0:8a2e:370:7334"sv),
		  Spans{"2001:db8:85a3:0:0:8a2e:370:7334"});
	EXPECT_EQ(ScanSpans(pattern, "x FFFF:0:0:0:0:0:0:1 y"sv),
		  Spans{"FFFF:0:0:0:0:0:0:1"});

	/* compressed forms are not recognized */
	EXPECT_TRUE(ScanSpans(pattern, "2001:db8::1"sv).empty());
	EXPECT_TRUE(ScanSpans(pattern, "::1"sv).empty());

	/* seven groups */
	EXPECT_TRUE(ScanSpans(pattern, "1:2:3:4:5:6:7"sv).empty());

	/* five hex digits */
	EXPECT_TRUE(ScanSpans(pattern, "12345:2:3:4:5:6:7:8"sv).empty());
}

TEST(ScannerTest, Candidate)
{
	const AddressPattern pattern;
	static constexpr auto text = "a 10.1.2.3 b [1:2:3:4:5:6:7:8] c"sv;

	auto scanner = pattern.Scan(text);

	auto c = scanner.Next();
	ASSERT_TRUE(c);
	EXPECT_EQ(c->span, "10.1.2.3"sv);
	EXPECT_EQ(c->value, "10.1.2.3"sv);
	EXPECT_EQ(c->begin, 2U);
	EXPECT_EQ(c->end, 10U);
	EXPECT_EQ(c->kind, AddressKind::IPV4);
	EXPECT_FALSE(c->HasBrackets());
	EXPECT_EQ(text.substr(c->begin, c->end - c->begin), c->span);

	c = scanner.Next();
	ASSERT_TRUE(c);
	EXPECT_EQ(c->span, "[1:2:3:4:5:6:7:8]"sv);
	EXPECT_EQ(c->value, "1:2:3:4:5:6:7:8"sv);
	EXPECT_EQ(c->begin, 13U);
	EXPECT_EQ(c->end, 30U);
	EXPECT_EQ(c->kind, AddressKind::IPV6);
	EXPECT_TRUE(c->HasBrackets());

	EXPECT_FALSE(scanner.Next());
	EXPECT_FALSE(scanner.Next());
	EXPECT_EQ(scanner.GetErrorCount(), 0U);
}

TEST(ScannerTest, Brackets)
{
	const AddressPattern pattern;

	EXPECT_EQ(ScanSpans(pattern, "[1.2.3.4]"sv), Spans{"[1.2.3.4]"});
	EXPECT_EQ(ScanSpans(pattern, "x[1.2.3.4]:80"sv), Spans{"[1.2.3.4]"});

	/* a lone bracket is not part of the candidate */
	EXPECT_EQ(ScanSpans(pattern, "[1.2.3.4 "sv), Spans{"1.2.3.4"});
	EXPECT_EQ(ScanSpans(pattern, " 1.2.3.4]"sv), Spans{"1.2.3.4"});
	EXPECT_EQ(ScanSpans(pattern, "[[1.2.3.4]]"sv), Spans{"[1.2.3.4]"});
}

TEST(ScannerTest, Adjacent)
{
	const AddressPattern pattern;

	EXPECT_EQ(ScanSpans(pattern, "1.2.3.4,5.6.7.8"sv),
		  (Spans{"1.2.3.4", "5.6.7.8"}));

	/* IPv4 is tried first; it may be the prefix of a longer
	   dotted sequence */
	EXPECT_EQ(ScanSpans(pattern, "1.2.3.4.5"sv), Spans{"1.2.3.4"});
}

TEST(ScannerTest, Empty)
{
	const AddressPattern pattern;

	EXPECT_TRUE(ScanSpans(pattern, ""sv).empty());
	EXPECT_TRUE(ScanSpans(pattern, "no addresses here"sv).empty());
}
