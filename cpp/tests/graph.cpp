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
#include <map>
#include <set>

#include <gtest/gtest.h>

#include <abstractor/graph.hpp>

using namespace abstractor;
using std::map;
using std::set;

namespace {

graph::NeighboursFunction< string > makeNeighbours(const map< string, vector< string > >& edges)
{
	return [edges](const string& vertex) -> vector< string >
	{
		auto it = edges.find(vertex);
		return (it != edges.end()) ? it->second : vector< string >();
	};
}

}

TEST(GraphReachability, IncludesStartVertex)
{
	auto result = graph::getReachableFrom< string >("a", makeNeighbours({}));
	EXPECT_EQ(set< string >({ "a" }), result);
}

TEST(GraphReachability, FollowsEdgesTransitively)
{
	auto neighbours = makeNeighbours({
		{ "a", { "b", "c" } },
		{ "b", { "d" } },
		{ "e", { "a" } },
	});
	EXPECT_EQ(set< string >({ "a", "b", "c", "d" }), graph::getReachableFrom< string >("a", neighbours));
	EXPECT_EQ(set< string >({ "d" }), graph::getReachableFrom< string >("d", neighbours));
}

TEST(GraphReachability, SurvivesCycles)
{
	auto neighbours = makeNeighbours({
		{ "a", { "b" } },
		{ "b", { "c", "a" } },
		{ "c", { "a", "c" } },
	});
	EXPECT_EQ(set< string >({ "a", "b", "c" }), graph::getReachableFrom< string >("b", neighbours));
}

TEST(GraphReachability, HandlesLongChainsWithoutRecursion)
{
	const size_t length = 200000;
	graph::NeighboursFunction< size_t > neighbours = [length](const size_t& vertex)
	{
		return (vertex + 1 < length) ? vector< size_t >{ vertex + 1 } : vector< size_t >();
	};
	EXPECT_EQ(length, graph::getReachableFrom< size_t >(0, neighbours).size());
}

TEST(GraphDistances, ReturnsShortestHopCountsInVisitingOrder)
{
	auto neighbours = makeNeighbours({
		{ "a", { "b", "c" } },
		{ "b", { "d" } },
		{ "c", { "d", "e" } },
		{ "d", { "a" } },
		{ "e", { "f" } },
	});
	auto result = graph::getDistancesFrom< string >("a", neighbours);

	vector< pair< string, size_t > > expected = {
		{ "a", 0 }, { "b", 1 }, { "c", 1 }, { "d", 2 }, { "e", 2 }, { "f", 3 }
	};
	EXPECT_EQ(expected, result);
}

TEST(GraphDistances, DistancesAreNonDecreasing)
{
	auto neighbours = makeNeighbours({
		{ "x", { "z", "y" } },
		{ "z", { "w" } },
		{ "y", { "w", "v" } },
		{ "w", { "u" } },
	});
	auto result = graph::getDistancesFrom< string >("x", neighbours);
	ASSERT_EQ(6u, result.size());
	for (size_t i = 1; i < result.size(); ++i)
	{
		EXPECT_LE(result[i-1].second, result[i].second);
	}
}
