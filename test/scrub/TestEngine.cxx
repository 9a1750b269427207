// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "scrub/Engine.hxx"
#include "scrub/ExclusionList.hxx"
#include "scrub/GeoLookup.hxx"
#include "scrub/Scanner.hxx"

#include <gtest/gtest.h>

#include <map>
#include <string>

using std::string_view_literals::operator""sv;
using namespace Scrub;

/**
 * A #CountryLookup with a fixed table.  It records how often it was
 * called.
 */
class FakeCountryLookup final : public CountryLookup {
	std::map<std::string, std::string, std::less<>> table;

public:
	unsigned n_calls = 0;

	FakeCountryLookup(std::initializer_list<std::pair<const std::string, std::string>> init)
		:table(init) {}

	GeoLookupResult LookupCountry(std::string_view address) noexcept override {
		++n_calls;

		const auto i = table.find(address);
		if (i == table.end())
			return GeoLookupResult::Failure();

		return GeoLookupResult::Found(i->second);
	}
};

class EngineTest : public ::testing::Test {
protected:
	const AddressPattern pattern;
	const ExclusionList exclusions = ExclusionList::Default();

	FakeCountryLookup lookup{
		{"203.0.113.5", "US"},
		{"[203.0.113.5]", "XX"},
		{"2001:db8:0:0:0:0:0:1", "de"},
		{"192.0.2.7", "invalid"},
	};

	std::string Transform(RedactionMode mode, std::string_view text,
			      RedactionStats &stats) {
		const RedactionEngine engine(pattern, exclusions, mode, &lookup);
		return engine.Transform(text, stats);
	}

	std::string Transform(RedactionMode mode, std::string_view text) {
		RedactionStats stats;
		return Transform(mode, text, stats);
	}
};

TEST_F(EngineTest, MaskIPv4)
{
	EXPECT_EQ(Transform(RedactionMode::MASK, "203.0.113.5"sv),
		  "203.0.XXX.XXX");
	EXPECT_EQ(Transform(RedactionMode::MASK,
			    "connect from 198.51.100.23 ok"sv),
		  "connect from 198.51.XXX.XXX ok");

	/* no lookups in mask mode */
	EXPECT_EQ(lookup.n_calls, 0U);
}

TEST_F(EngineTest, MaskIPv6)
{
	EXPECT_EQ(Transform(RedactionMode::MASK,
			    "src=2001:db8:85a3:0:0:8a2e:370:7334 dst=x"sv),
		  "src=2001:db8:XXXX:XXXX:XXXX:XXXX:XXXX:XXXX dst=x");
}

TEST_F(EngineTest, CountryCode)
{
	RedactionStats stats;
	EXPECT_EQ(Transform(RedactionMode::COUNTRY_CODE,
			    "a 203.0.113.5 b 2001:db8:0:0:0:0:0:1 c"sv, stats),
		  "a [US] b [DE] c");
	EXPECT_EQ(lookup.n_calls, 2U);
	EXPECT_EQ(stats.candidates, 2U);
	EXPECT_EQ(stats.country, 2U);
	EXPECT_EQ(stats.masked, 0U);
	EXPECT_EQ(stats.lookup_failures, 0U);
}

TEST_F(EngineTest, CountryCodeFallback)
{
	RedactionStats stats;
	EXPECT_EQ(Transform(RedactionMode::COUNTRY_CODE,
			    "198.51.100.23 192.0.2.7"sv, stats),
		  "198.51.XXX.XXX 192.0.XXX.XXX");
	EXPECT_EQ(stats.candidates, 2U);
	EXPECT_EQ(stats.country, 0U);
	EXPECT_EQ(stats.masked, 2U);
	EXPECT_EQ(stats.lookup_failures, 2U);
}

TEST_F(EngineTest, NoDatabase)
{
	const RedactionEngine engine(pattern, exclusions,
				     RedactionMode::COUNTRY_CODE, nullptr);

	RedactionStats stats;
	EXPECT_EQ(engine.Transform("203.0.113.5"sv, stats), "203.0.XXX.XXX");
	EXPECT_EQ(stats.lookup_failures, 1U);
	EXPECT_EQ(stats.masked, 1U);
}

TEST_F(EngineTest, Brackets)
{
	/* the lookup gets the address without brackets */
	EXPECT_EQ(Transform(RedactionMode::COUNTRY_CODE, "[203.0.113.5]:80"sv),
		  "[US]:80");

	EXPECT_EQ(Transform(RedactionMode::MASK, "[203.0.113.5]:80"sv),
		  "[203.0.XXX.XXX]:80");
	EXPECT_EQ(Transform(RedactionMode::COUNTRY_CODE, "[198.51.100.23]"sv),
		  "[198.51.XXX.XXX]");
	EXPECT_EQ(Transform(RedactionMode::MASK, "[1:2:3:4:5:6:7:8]"sv),
		  "[1:2:XXXX:XXXX:XXXX:XXXX:XXXX:XXXX]");
}

TEST_F(EngineTest, Excluded)
{
	for (const auto mode : {RedactionMode::MASK, RedactionMode::COUNTRY_CODE}) {
		RedactionStats stats;
		EXPECT_EQ(Transform(mode, "listen on 127.0.0.1:80 [0.0.0.0]"sv, stats),
			  "listen on 127.0.0.1:80 [0.0.0.0]");
		EXPECT_EQ(Transform(mode, "0:0:0:0:0:0:0:1"sv),
			  "0:0:0:0:0:0:0:1");
		EXPECT_EQ(stats.candidates, 2U);
		EXPECT_EQ(stats.excluded, 2U);
	}

	/* excluded addresses are never looked up */
	EXPECT_EQ(lookup.n_calls, 0U);
}

TEST_F(EngineTest, ExcludedLiteral)
{
	/* the exclusion list is not normalized */
	EXPECT_EQ(Transform(RedactionMode::MASK, "127.000.000.001"sv),
		  "127.000.XXX.XXX");
}

TEST_F(EngineTest, PreserveText)
{
	static constexpr auto text =
		"\xef\xbf\xbd line 1\n\ttab 1.2.3.4\r\nend 5.6.7.8"sv;

	EXPECT_EQ(Transform(RedactionMode::MASK, text),
		  "\xef\xbf\xbd line 1\n\ttab 1.2.XXX.XXX\r\nend 5.6.XXX.XXX");

	EXPECT_EQ(Transform(RedactionMode::MASK, "no addresses\n"sv),
		  "no addresses\n");
	EXPECT_EQ(Transform(RedactionMode::MASK, ""sv), "");
}

TEST_F(EngineTest, SecondPass)
{
	/* masked addresses do not match the address pattern, so a
	   second pass leaves them alone */
	const auto once = Transform(RedactionMode::MASK,
				    "1.2.3.4 1:2:3:4:5:6:7:8"sv);
	ASSERT_EQ(once, "1.2.XXX.XXX 1:2:XXXX:XXXX:XXXX:XXXX:XXXX:XXXX");

	RedactionStats stats;
	EXPECT_EQ(Transform(RedactionMode::MASK, once, stats), once);
	EXPECT_EQ(stats.candidates, 0U);

	/* neither do country codes */
	EXPECT_EQ(Transform(RedactionMode::COUNTRY_CODE, "[US] [DE]"sv),
		  "[US] [DE]");
}

TEST(GeoLookupResultTest, Found)
{
	const auto r = GeoLookupResult::Found("us"sv);
	ASSERT_TRUE(r.IsFound());
	EXPECT_EQ(r.GetCountryCode(), "US"sv);

	EXPECT_FALSE(GeoLookupResult::Found(""sv).IsFound());
	EXPECT_FALSE(GeoLookupResult::Found("USA"sv).IsFound());
	EXPECT_FALSE(GeoLookupResult::Found("1A"sv).IsFound());
	EXPECT_FALSE(GeoLookupResult::Failure().IsFound());
}
