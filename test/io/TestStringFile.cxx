// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "io/StringFile.hxx"
#include "system/Error.hxx"

#include <gtest/gtest.h>

#include <fstream>

#include <stdio.h>
#include <sys/stat.h>

TEST(StringFileTest, Load)
{
	const TempDirectory dir;
	const auto path = dir.Path("a.log");

	std::string contents;
	for (unsigned i = 0; i < 10000; ++i)
		contents += "connect from 198.51.100.23 ok\n";

	std::ofstream(path) << contents;

	EXPECT_EQ(LoadStringFile(path.c_str()), contents);
}

TEST(StringFileTest, Empty)
{
	const TempDirectory dir;
	const auto path = dir.Path("empty.log");
	std::ofstream{path};

	EXPECT_EQ(LoadStringFile(path.c_str()), "");
}

TEST(StringFileTest, NotFound)
{
	const TempDirectory dir;
	const auto path = dir.Path("nonexistent.log");

	try {
		LoadStringFile(path.c_str());
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsFileNotFound(e));
	}
}

TEST(StringFileTest, Directory)
{
	const TempDirectory dir;

	EXPECT_THROW(LoadStringFile(dir.GetPath().c_str()), std::runtime_error);
}

TEST(StringFileTest, TooLarge)
{
	const TempDirectory dir;
	const auto path = dir.Path("large.log");
	std::ofstream(path) << "0123456789";

	EXPECT_THROW(LoadStringFile(path.c_str(), 9), std::runtime_error);
	EXPECT_EQ(LoadStringFile(path.c_str(), 10), "0123456789");
}

TEST(StringFileTest, Attributes)
{
	const TempDirectory dir;
	const auto path = dir.Path("private.log");
	std::ofstream(path) << "abc";
	ASSERT_EQ(chmod(path.c_str(), 0604), 0);

	struct stat st;
	EXPECT_EQ(LoadStringFile(path.c_str(), st), "abc");
	EXPECT_TRUE(S_ISREG(st.st_mode));
	EXPECT_EQ(st.st_mode & 07777, 0604U);
	EXPECT_EQ(st.st_size, 3);

	/* the attributes belong to the file which was read, even if
	   the path now refers to another one */
	const auto other = dir.Path("other.log");
	std::ofstream(other) << "12345";
	ASSERT_EQ(rename(other.c_str(), path.c_str()), 0);

	struct stat st2;
	ASSERT_EQ(stat(path.c_str(), &st2), 0);
	EXPECT_NE(st2.st_ino, st.st_ino);
}
