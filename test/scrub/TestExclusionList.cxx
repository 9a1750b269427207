// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "scrub/ExclusionList.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using std::string_view_literals::operator""sv;
using namespace Scrub;

TEST(ExclusionListTest, Default)
{
	const auto list = ExclusionList::Default();

	EXPECT_EQ(list.size(), 4U);
	EXPECT_TRUE(list.Contains("127.0.0.1"sv));
	EXPECT_TRUE(list.Contains("0.0.0.0"sv));
	EXPECT_TRUE(list.Contains("0:0:0:0:0:0:0:1"sv));
	EXPECT_TRUE(list.Contains("0000:0000:0000:0000:0000:0000:0000:0001"sv));

	EXPECT_FALSE(list.Contains("127.0.0.2"sv));
	EXPECT_FALSE(list.Contains(""sv));
}

TEST(ExclusionListTest, Literal)
{
	const auto list = ExclusionList::Default();

	/* no normalization */
	EXPECT_FALSE(list.Contains("127.000.000.001"sv));
	EXPECT_FALSE(list.Contains("0:0:0:0:0:0:0:01"sv));
	EXPECT_FALSE(list.Contains("0000:0000:0000:0000:0000:0000:0000:0001 "sv));

	const ExclusionList hex{"2001:DB8:0:0:0:0:0:1"sv};
	EXPECT_TRUE(hex.Contains("2001:DB8:0:0:0:0:0:1"sv));
	EXPECT_FALSE(hex.Contains("2001:db8:0:0:0:0:0:1"sv));
}

TEST(ExclusionListTest, With)
{
	const auto base = ExclusionList::Default();
	const std::vector<std::string> more{"192.0.2.1", "127.0.0.1"};

	const auto list = base.With(more);
	EXPECT_EQ(list.size(), 5U);
	EXPECT_TRUE(list.Contains("192.0.2.1"sv));
	EXPECT_TRUE(list.Contains("127.0.0.1"sv));

	/* the original is unmodified */
	EXPECT_EQ(base.size(), 4U);
	EXPECT_FALSE(base.Contains("192.0.2.1"sv));
}

TEST(ExclusionListTest, Empty)
{
	const ExclusionList list;
	EXPECT_TRUE(list.empty());
	EXPECT_FALSE(list.Contains("127.0.0.1"sv));
}
