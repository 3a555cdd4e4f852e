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
#include <gtest/gtest.h>

#include <abstractor/collector.hpp>

#include "helpers.hpp"

using namespace abstractor;
using namespace abstractor::tests;

namespace {

PackageCollection collectFrom(const string& content)
{
	TemporaryDirectory directory;
	auto path = directory.writeFile("records", content);

	PackageCollection collection;
	collectors::RecordFileCollector(path).collect(collection);
	return collection;
}

}

TEST(RecordFileCollector, ReadsStanzas)
{
	auto collection = collectFrom(
			"# installed on the build host\n"
			"Package: editor:amd64\n"
			"Tier: upper\n"
			"Description: text editor\n"
			"Category: editors\n"
			"Variety: amd64\n"
			"Installation: manual\n"
			"Installed-Size: 2.5 MB\n"
			"Requires: libc:amd64, ncurses:amd64\n"
			"Advises: spell\n"
			"Suggests: docs\n"
			"\n"
			"Package: libc:amd64\n"
			"Tier: lower\n"
			"Name: glibc\n"
			"Installed-Size: 12 KiB\n"
			"\n"
			"\n"
			"Package: ncurses:amd64\n"
			"Tier: lower\n"
			"Installed-Size: 300\n"
			"Requires: libc:amd64\n");

	EXPECT_EQ(vector< string >({ "editor:amd64" }), collection.getIdentifiers(Tier::Upper));
	EXPECT_EQ(vector< string >({ "libc:amd64", "ncurses:amd64" }), collection.getIdentifiers(Tier::Lower));

	const auto& editor = collection.get("editor:amd64");
	EXPECT_EQ("editor", editor.name);
	EXPECT_EQ("text editor", editor.description);
	EXPECT_EQ("editors", editor.category);
	EXPECT_EQ("amd64", editor.variety);
	EXPECT_EQ("manual", editor.installation);
	EXPECT_EQ(2500000u, editor.installedBytes);
	EXPECT_EQ(vector< string >({ "libc:amd64", "ncurses:amd64" }), editor.relations[RT::Requires]);
	EXPECT_EQ(vector< string >({ "spell" }), editor.relations[RT::Advises]);
	EXPECT_EQ(vector< string >({ "docs" }), editor.relations[RT::Suggests]);
	EXPECT_TRUE(editor.relations[RT::Enhances].empty());

	EXPECT_EQ("glibc", collection.get("libc:amd64").name);
	EXPECT_EQ(12288u, collection.get("libc:amd64").installedBytes);
	EXPECT_EQ(300u, collection.get("ncurses:amd64").installedBytes);
}

TEST(RecordFileCollector, DefaultsAndUnknownFields)
{
	auto collection = collectFrom(
			"Package: tool\n"
			"Tier: upper\n"
			"Homepage: https://example.org\n"
			"Supplements: shell\n");

	const auto& tool = collection.get("tool");
	EXPECT_EQ("tool", tool.name);
	EXPECT_EQ(0u, tool.installedBytes);
	EXPECT_TRUE(tool.category.empty());
	EXPECT_EQ(vector< string >({ "shell" }), tool.relations[RT::Supplements]);
}

TEST(RecordFileCollector, EmptyFile)
{
	EXPECT_EQ(0u, collectFrom("").size());
	EXPECT_EQ(0u, collectFrom("\n\n# nothing\n").size());
}

TEST(RecordFileCollector, Errors)
{
	EXPECT_THROW(collectFrom("Package: a\nTier: upper\n\nPackage: a\nTier: lower\n"), Exception);
	EXPECT_THROW(collectFrom("Package: a\nTier: middle\n"), Exception);
	EXPECT_THROW(collectFrom("Package: a\n"), Exception);
	EXPECT_THROW(collectFrom("Tier: upper\nName: a\n"), Exception);
	EXPECT_THROW(collectFrom("Package: a\nTier: upper\nInstalled-Size: -5\n"), Exception);
	EXPECT_THROW(collectFrom("Package: a\nTier: upper\nInstalled-Size: 5 parsecs\n"), Exception);
	EXPECT_THROW(collectFrom("Package: a\nTier: upper\nInstalled-Size: 18446744073709551615 B\n"), Exception);
	EXPECT_THROW(collectFrom("Package a\n"), Exception);
}

TEST(RecordFileCollector, LastLineWithoutNewline)
{
	auto collection = collectFrom("Package: a\nTier: upper\n\nPackage: b\nTier: lower");
	EXPECT_EQ(2u, collection.size());
	EXPECT_EQ(PackageCollection::Tier::Lower, collection.getTier("b"));

	EXPECT_THROW(collectFrom("Package: a\nTier: upper\n\nX"), Exception);
	EXPECT_THROW(collectFrom("Package: a\nTier: upper\nX"), Exception);
}

TEST(RecordFileCollector, MissingFile)
{
	TemporaryDirectory directory;
	PackageCollection collection;
	collectors::RecordFileCollector collector(directory.getPath() + "/absent");
	EXPECT_THROW(collector.collect(collection), Exception);
	EXPECT_THROW(collectors::RecordFileCollector(""), Exception);
}

TEST(RecordFileCollector, PromotesByDefault)
{
	collectors::RecordFileCollector collector("records");
	EXPECT_EQ(analysis::PostProcessing::Promote, collector.getDefaultPostProcessing());
}
