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

#include <abstractor/analysis.hpp>
#include <abstractor/graph.hpp>

#include "helpers.hpp"

using namespace abstractor;
using namespace abstractor::tests;

namespace {

PackageCollection makeDiamond()
{
	// app -> gui -> toolkit -> libc
	//   \-> net ---------------/
	//   ~~> docs (advised) -> viewer
	PackageCollection collection;
	collection.put(Tier::Upper, "app", makeDetails(10, { "gui", "net" }, { "docs" }));
	collection.put(Tier::Lower, "gui", makeDetails(20, { "toolkit" }));
	collection.put(Tier::Lower, "toolkit", makeDetails(30, { "libc" }));
	collection.put(Tier::Lower, "net", makeDetails(40, { "libc" }));
	collection.put(Tier::Lower, "libc", makeDetails(50));
	collection.put(Tier::Lower, "docs", makeDetails(60, { "viewer" }));
	collection.put(Tier::Lower, "viewer", makeDetails(70, {}, { "libc" }));
	return collection;
}

set< string > followEdges(const PackageCollection& collection, const string& from, bool withAdvises)
{
	graph::NeighboursFunction< string > neighbours = [&collection, withAdvises](const string& identifier)
			-> vector< string >
	{
		vector< string > result;
		const auto& details = collection.get(identifier);
		for (const string& dependency: details.relations[RT::Requires])
		{
			if (collection.contains(dependency)) result.push_back(dependency);
		}
		if (withAdvises)
		{
			for (const string& dependency: details.relations[RT::Advises])
			{
				if (collection.contains(dependency)) result.push_back(dependency);
			}
		}
		return result;
	};
	auto result = graph::getReachableFrom(from, neighbours);
	result.erase(from);
	return result;
}

}

TEST(Closure, MandatoryAndComplementarySets)
{
	auto collection = makeDiamond();
	analysis::computeRecursiveDependencies(collection);

	const auto& app = collection.get("app");
	EXPECT_EQ(set< string >({ "gui", "net", "toolkit", "libc" }), app.recursiveRequires);
	EXPECT_EQ(set< string >({ "docs", "viewer" }), app.recursiveComplements);

	const auto& viewer = collection.get("viewer");
	EXPECT_TRUE(viewer.recursiveRequires.empty());
	EXPECT_EQ(set< string >({ "libc" }), viewer.recursiveComplements);

	const auto& libc = collection.get("libc");
	EXPECT_EQ(set< string >({ "app", "gui", "toolkit", "net" }), libc.recursiveWhatRequires);
	EXPECT_EQ(set< string >({ "docs", "viewer" }), libc.recursiveWhatComplements);
}

TEST(Closure, MatchesFixedPointOfEdges)
{
	auto collection = makeDiamond();
	analysis::computeRecursiveDependencies(collection);

	for (const string& identifier: collection.getIdentifiers())
	{
		const auto& details = collection.get(identifier);
		auto mandatory = followEdges(collection, identifier, false);
		EXPECT_EQ(mandatory, details.recursiveRequires) << identifier;

		auto all = followEdges(collection, identifier, true);
		for (const string& dependency: mandatory)
		{
			all.erase(dependency);
		}
		EXPECT_EQ(all, details.recursiveComplements) << identifier;
	}
}

TEST(Closure, ReverseIndexesAreDual)
{
	auto collection = makeDiamond();
	analysis::computeRecursiveDependencies(collection);

	auto identifiers = collection.getIdentifiers();
	for (const string& i: identifiers)
	{
		for (const string& d: identifiers)
		{
			const auto& iDetails = collection.get(i);
			const auto& dDetails = collection.get(d);
			EXPECT_EQ(iDetails.recursiveRequires.count(d), dDetails.recursiveWhatRequires.count(i)) << i << ' ' << d;
			EXPECT_EQ(iDetails.recursiveComplements.count(d), dDetails.recursiveWhatComplements.count(i)) << i << ' ' << d;
		}
	}
}

TEST(Closure, CyclesProduceFiniteClosures)
{
	PackageCollection collection;
	collection.put(Tier::Upper, "A", makeDetails(1, { "B" }));
	collection.put(Tier::Lower, "B", makeDetails(1, { "A" }));
	analysis::computeRecursiveDependencies(collection);

	EXPECT_EQ(set< string >({ "B" }), collection.get("A").recursiveRequires);
	EXPECT_EQ(set< string >({ "A" }), collection.get("B").recursiveRequires);
	EXPECT_EQ(set< string >({ "B" }), collection.get("A").recursiveWhatRequires);
	EXPECT_TRUE(collection.get("A").recursiveComplements.empty());
}

TEST(Closure, SelfReferencesAreExcluded)
{
	PackageCollection collection;
	collection.put(Tier::Upper, "a", makeDetails(1, { "a", "b" }, { "a" }));
	collection.put(Tier::Lower, "b", makeDetails(1));
	analysis::computeRecursiveDependencies(collection);

	EXPECT_EQ(set< string >({ "b" }), collection.get("a").recursiveRequires);
	EXPECT_TRUE(collection.get("a").recursiveComplements.empty());
	EXPECT_TRUE(collection.get("a").recursiveWhatRequires.empty());
}

TEST(Closure, DanglingEdgesAreInert)
{
	PackageCollection collection;
	collection.put(Tier::Upper, "a", makeDetails(1, { "missing", "b" }, { "absent" }));
	collection.put(Tier::Lower, "b", makeDetails(1, { "missing" }));
	analysis::computeRecursiveDependencies(collection);

	EXPECT_EQ(set< string >({ "b" }), collection.get("a").recursiveRequires);
	EXPECT_TRUE(collection.get("a").recursiveComplements.empty());
	EXPECT_FALSE(collection.contains("missing"));
}

TEST(Closure, AdvisedPathToMandatoryDependencyIsNotComplement)
{
	PackageCollection collection;
	collection.put(Tier::Upper, "a", makeDetails(1, { "b" }, { "c" }));
	collection.put(Tier::Lower, "b", makeDetails(1));
	collection.put(Tier::Lower, "c", makeDetails(1, { "b" }));
	analysis::computeRecursiveDependencies(collection);

	EXPECT_EQ(set< string >({ "b" }), collection.get("a").recursiveRequires);
	EXPECT_EQ(set< string >({ "c" }), collection.get("a").recursiveComplements);
	EXPECT_TRUE(collection.get("b").recursiveWhatComplements.empty());
}

TEST(Closure, RecomputationIsIdempotent)
{
	auto once = makeDiamond();
	analysis::computeRecursiveDependencies(once);

	auto twice = once;
	analysis::computeRecursiveDependencies(twice);

	for (const string& identifier: once.getIdentifiers())
	{
		const auto& first = once.get(identifier);
		const auto& second = twice.get(identifier);
		EXPECT_EQ(first.recursiveRequires, second.recursiveRequires);
		EXPECT_EQ(first.recursiveComplements, second.recursiveComplements);
		EXPECT_EQ(first.recursiveWhatRequires, second.recursiveWhatRequires);
		EXPECT_EQ(first.recursiveWhatComplements, second.recursiveWhatComplements);
	}
}
