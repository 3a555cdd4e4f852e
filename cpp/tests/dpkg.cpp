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
#include <utime.h>

#include <gtest/gtest.h>

#include <abstractor/collector.hpp>
#include <abstractor/config.hpp>

#include "helpers.hpp"

using namespace abstractor;
using namespace abstractor::tests;

namespace {

const char* const statusContent =
		"Package: dpkg\n"
		"Status: install ok installed\n"
		"Priority: required\n"
		"Section: admin\n"
		"Installed-Size: 6000\n"
		"Architecture: amd64\n"
		"Pre-Depends: libc6 (>= 2.34)\n"
		"Description: Debian package management system\n"
		" This package provides the low-level infrastructure.\n"
		"\n"
		"Package: libc6\n"
		"Status: install ok installed\n"
		"Priority: optional\n"
		"Section: libs\n"
		"Installed-Size: 12000\n"
		"Architecture: amd64\n"
		"Description: GNU C Library\n"
		"\n"
		"Package: editor\n"
		"Status: install ok installed\n"
		"Priority: optional\n"
		"Section: editors\n"
		"Installed-Size: 100\n"
		"Architecture: amd64\n"
		"Depends: libtinfo6 (>= 6), libc6 (>= 2.34)\n"
		"Recommends: aspell | spell\n"
		"Suggests: mail-transport-agent\n"
		"Description: text editor\n"
		"\n"
		"Package: libtinfo6\n"
		"Status: install ok installed\n"
		"Priority: optional\n"
		"Section: libs\n"
		"Installed-Size: 500\n"
		"Architecture: amd64\n"
		"Depends: libc6:amd64\n"
		"\n"
		"Package: aspell\n"
		"Status: deinstall ok config-files\n"
		"Priority: optional\n"
		"Section: text\n"
		"Architecture: amd64\n"
		"\n"
		"Package: spell\n"
		"Status: install ok installed\n"
		"Priority: optional\n"
		"Section: text\n"
		"Installed-Size: 50\n"
		"Architecture: amd64\n"
		"\n"
		"Package: postfix\n"
		"Status: hold ok installed\n"
		"Priority: optional\n"
		"Section: mail\n"
		"Installed-Size: 4000\n"
		"Architecture: amd64\n"
		"Provides: mail-transport-agent\n"
		"\n"
		"Package: docs\n"
		"Status: install ok installed\n"
		"Priority: optional\n"
		"Section: doc\n"
		"Installed-Size: 10\n"
		"Architecture: all\n"
		"\n"
		"Package: orphan-lib\n"
		"Status: install ok installed\n"
		"Priority: optional\n"
		"Section: oldlibs\n"
		"Installed-Size: 1\n"
		"Architecture: amd64\n";

const char* const extendedStatesContent =
		"Package: spell\n"
		"Architecture: amd64\n"
		"Auto-Installed: 1\n"
		"\n"
		"Package: postfix\n"
		"Architecture: amd64\n"
		"Auto-Installed: 1\n"
		"\n"
		"Package: orphan-lib\n"
		"Architecture: amd64\n"
		"Auto-Installed: 1\n"
		"\n"
		"Package: editor\n"
		"Architecture: amd64\n"
		"Auto-Installed: 0\n";

class DpkgCollectorTest: public ::testing::Test
{
 protected:
	TemporaryDirectory directory;
	Config config;

	void SetUp()
	{
		config.setScalar("dir", directory.getPath());
	}

	void writeDatabase(const string& status, const string& extendedStates)
	{
		directory.writeFile("var/lib/dpkg/status", status);
		if (!extendedStates.empty())
		{
			directory.writeFile("var/lib/apt/extended_states", extendedStates);
		}
	}

	void writeHistoryFile(const string& name, time_t modificationTime, const string& content)
	{
		auto path = directory.writeFile(string("var/log/apt/") + name, content);
		struct utimbuf times;
		times.actime = modificationTime;
		times.modtime = modificationTime;
		ASSERT_EQ(0, utime(path.c_str(), &times));
	}

	PackageCollection collect()
	{
		PackageCollection collection;
		collectors::DpkgCollector(config).collect(collection);
		return collection;
	}
};

}

TEST_F(DpkgCollectorTest, Tiers)
{
	writeDatabase(statusContent, extendedStatesContent);
	auto collection = collect();

	EXPECT_EQ(vector< string >({ "docs:amd64", "editor:amd64" }), collection.getIdentifiers(Tier::Upper));
	EXPECT_EQ(vector< string >({ "libtinfo6:amd64", "orphan-lib:amd64", "postfix:amd64", "spell:amd64" }),
			collection.getIdentifiers(Tier::Lower));
	EXPECT_FALSE(collection.contains("dpkg:amd64"));
	EXPECT_FALSE(collection.contains("libc6:amd64"));
	EXPECT_FALSE(collection.contains("aspell:amd64"));
}

TEST_F(DpkgCollectorTest, Details)
{
	writeDatabase(statusContent, extendedStatesContent);
	auto collection = collect();

	const auto& editor = collection.get("editor:amd64");
	EXPECT_EQ("editor", editor.name);
	EXPECT_EQ("text editor", editor.description);
	EXPECT_EQ("editors", editor.category);
	EXPECT_EQ("amd64", editor.variety);
	EXPECT_EQ("manual", editor.installation);
	EXPECT_EQ(102400u, editor.installedBytes);

	EXPECT_EQ("automatic", collection.get("spell:amd64").installation);
	EXPECT_EQ("all", collection.get("docs:amd64").variety);
}

TEST_F(DpkgCollectorTest, Relations)
{
	writeDatabase(statusContent, extendedStatesContent);
	auto collection = collect();

	const auto& editor = collection.get("editor:amd64");
	// system packages are not a part of the collection
	EXPECT_EQ(vector< string >({ "libtinfo6:amd64" }), editor.relations[RT::Requires]);
	// the first installed alternative
	EXPECT_EQ(vector< string >({ "spell:amd64" }), editor.relations[RT::Advises]);
	// via a virtual package
	EXPECT_EQ(vector< string >({ "postfix:amd64" }), editor.relations[RT::Suggests]);

	EXPECT_TRUE(collection.get("libtinfo6:amd64").relations[RT::Requires].empty());
}

TEST_F(DpkgCollectorTest, SupportSectionsAreLower)
{
	writeDatabase(statusContent, "");
	auto collection = collect();

	// no extended states, everything is manually installed
	EXPECT_TRUE(collection.isUpper("spell:amd64"));
	EXPECT_TRUE(collection.isUpper("orphan-lib:amd64"));
	EXPECT_FALSE(collection.isUpper("libtinfo6:amd64"));
}

TEST_F(DpkgCollectorTest, SystemDefinitionIsConfigurable)
{
	writeDatabase(statusContent, extendedStatesContent);
	config.setList("abstractor::dpkg::system-sections", "mail");
	auto collection = collect();

	EXPECT_FALSE(collection.contains("postfix:amd64"));
	EXPECT_TRUE(collection.get("editor:amd64").relations[RT::Suggests].empty());
}

TEST_F(DpkgCollectorTest, Errors)
{
	EXPECT_THROW(collect(), Exception);

	writeDatabase("Package: broken\nArchitecture: amd64\n", "");
	EXPECT_THROW(collect(), Exception);

	writeDatabase("Package: broken\nStatus: installed\n", "");
	EXPECT_THROW(collect(), Exception);

	writeDatabase("Package: huge\nStatus: install ok installed\nArchitecture: amd64\n"
			"Installed-Size: 18014398509481984\n", "");
	EXPECT_THROW(collect(), Exception);

	writeDatabase(statusContent, "Package: editor\nArchitecture: amd64\nAuto-Installed: maybe\n");
	EXPECT_THROW(collect(), Exception);
}

TEST_F(DpkgCollectorTest, History)
{
	writeDatabase(statusContent, "");
	config.setList("abstractor::dpkg::support-sections", "oldlibs");

	writeHistoryFile("history.log.1", 1600000000,
			"\n"
			"Start-Date: 2023-01-10  09:00:00\n"
			"Commandline: /usr/bin/unattended-installer\n"
			"Install: docs:amd64 (1.0)\n"
			"End-Date: 2023-01-10  09:00:05\n"
			"\n"
			"Start-Date: 2023-01-11  10:00:00\n"
			"Commandline: apt install libtinfo6 orphan-lib\n"
			"Requested-By: user (1000)\n"
			"Install: libtinfo6:amd64 (6.4-2), orphan-lib:amd64 (1.0)\n"
			"End-Date: 2023-01-11  10:00:02\n");
	writeHistoryFile("history.log", 1700000000,
			"\n"
			"Start-Date: 2023-11-14  12:00:00\n"
			"Commandline: apt install postfix\n"
			"Requested-By: user (1000)\n"
			"Install: postfix:amd64 (3.7.6-0+deb12u2, automatic)\n"
			"End-Date: 2023-11-14  12:00:10\n"
			"\n"
			"Start-Date: 2023-11-15  08:00:00\n"
			"Commandline: apt remove orphan-lib\n"
			"Requested-By: user (1000)\n"
			"Remove: orphan-lib:amd64 (1.0)\n"
			"End-Date: 2023-11-15  08:00:01\n");
	writeHistoryFile("history.log.2.gz", 1500000000, "not a text file");

	auto collection = collect();

	// installed without a requesting user
	EXPECT_FALSE(collection.contains("docs:amd64"));
	// explicitly installed library
	EXPECT_TRUE(collection.isUpper("libtinfo6:amd64"));
	// the later removal cancels the explicit installation
	EXPECT_FALSE(collection.isUpper("orphan-lib:amd64"));
	// automatic according to the history despite missing extended states
	EXPECT_FALSE(collection.isUpper("postfix:amd64"));
	EXPECT_TRUE(collection.isUpper("editor:amd64"));
	EXPECT_TRUE(collection.isUpper("spell:amd64"));
}

TEST_F(DpkgCollectorTest, HistoryIsOptional)
{
	writeDatabase(statusContent, extendedStatesContent);
	config.setScalar("dir::log::history", directory.getPath() + "/absent/history.log");
	auto collection = collect();

	EXPECT_TRUE(collection.isUpper("docs:amd64"));
	EXPECT_FALSE(collection.isUpper("libtinfo6:amd64"));
}

TEST_F(DpkgCollectorTest, PrunesByDefault)
{
	collectors::DpkgCollector collector(config);
	EXPECT_EQ(analysis::PostProcessing::Prune, collector.getDefaultPostProcessing());
}
