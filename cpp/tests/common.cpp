/**************************************************************************
*   Copyright (C) 2023 by Eugene V. Lyubimkin                             *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#include <sys/stat.h>

#include <gtest/gtest.h>

#include <abstractor/common.hpp>

#include <internal/common.hpp>

#include "helpers.hpp"

using namespace abstractor;

TEST(Common, HumanToBytes)
{
	using internal::humanToBytes;

	EXPECT_EQ(0u, humanToBytes("0"));
	EXPECT_EQ(4096u, humanToBytes(" 4096 "));
	EXPECT_EQ(1500u, humanToBytes("1.5 kB"));
	EXPECT_EQ(12500000u, humanToBytes("12.5 MB"));
	EXPECT_EQ(3072u, humanToBytes("3 KiB"));
	EXPECT_EQ(1073741824u, humanToBytes("1 GiB"));
	EXPECT_EQ(7u, humanToBytes("7 bytes"));

	EXPECT_THROW(humanToBytes(""), Exception);
	EXPECT_THROW(humanToBytes("-1"), Exception);
	EXPECT_THROW(humanToBytes("12abc"), Exception);
	EXPECT_THROW(humanToBytes("1 XB"), Exception);
	EXPECT_THROW(humanToBytes("one MB"), Exception);
	EXPECT_THROW(humanToBytes("-2 MB"), Exception);
	EXPECT_THROW(humanToBytes("1 2 MB"), Exception);

	EXPECT_EQ(18446744073709551615u, humanToBytes("18446744073709551615"));
	EXPECT_THROW(humanToBytes("100 EiB"), Exception);
	EXPECT_THROW(humanToBytes("18446744073709551615 B"), Exception);
	EXPECT_THROW(humanToBytes("inf B"), Exception);
	EXPECT_THROW(humanToBytes("nan kB"), Exception);
	EXPECT_THROW(humanToBytes("1e300 GB"), Exception);
}

TEST(Common, Split)
{
	using internal::split;

	EXPECT_EQ(vector< string >({ "a", "b", "c" }), split(',', "a,b,,c"));
	EXPECT_EQ(vector< string >({ "a", "b", "", "c" }), split(',', "a,b,,c", true));
	EXPECT_TRUE(split(',', "").empty());
	EXPECT_EQ(vector< string >({ " x ", " y" }), split('|', " x | y"));
}

TEST(Common, Trim)
{
	EXPECT_EQ("word", internal::trim("  word\t\n"));
	EXPECT_EQ("two words", internal::trim("two words"));
	EXPECT_EQ("", internal::trim(" \t "));
}

TEST(Common, Join)
{
	EXPECT_EQ("a, b", join(", ", { "a", "b" }));
	EXPECT_EQ("", join(", ", {}));
}

TEST(Common, Format)
{
	EXPECT_EQ("3 packages, 1.50 s", format2("%zu packages, %.2f s", size_t(3), 1.5));
	EXPECT_EQ("name 'x'", format2("name '%s'", string("x")));
}

TEST(Common, TemporaryDirectoryCleanup)
{
	string path;
	{
		tests::TemporaryDirectory directory;
		path = directory.getPath();
		directory.writeFile("plain", "x");
		directory.writeFile("it's \"quoted\" $(true)/nested dir/file", "y");
		directory.writeFile("it's \"quoted\" $(true)/second", "");

		struct stat s;
		ASSERT_EQ(0, stat((path + "/it's \"quoted\" $(true)/nested dir/file").c_str(), &s));
	}
	struct stat s;
	EXPECT_EQ(-1, lstat(path.c_str(), &s));
}
