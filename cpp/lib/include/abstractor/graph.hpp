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
#ifndef ABSTRACTOR_GRAPH_SEEN
#define ABSTRACTOR_GRAPH_SEEN

/// @file

#include <functional>
#include <map>
#include <queue>
#include <set>

#include <abstractor/common.hpp>

namespace abstractor {
namespace graph {

using std::map;
using std::set;
using std::queue;

/// returns the list of direct neighbours of a vertex
template < class T >
using NeighboursFunction = std::function< vector< T > (const T&) >;

/// finds all vertices reachable from the vertex
/**
 * The search uses an explicit queue, so its depth is not limited by the call
 * stack. Every vertex is visited at most once, cycles are allowed.
 *
 * @param from start vertex
 * @param getNeighbours function returning direct neighbours of a vertex
 * @return all vertices reachable from @a from, including @a from itself
 */
template < class T >
set< T > getReachableFrom(const T& from, const NeighboursFunction< T >& getNeighbours)
{
	queue< T > currentVertices;
	currentVertices.push(from);

	set< T > result = { from };

	while (!currentVertices.empty())
	{
		auto currentVertex = currentVertices.front();
		currentVertices.pop();

		for (const T& neighbour: getNeighbours(currentVertex))
		{
			auto insertResult = result.insert(neighbour);
			if (insertResult.second)
			{
				currentVertices.push(neighbour); // non-seen yet vertex
			}
		}
	}

	return result;
}

/// computes shortest hop counts from the vertex
/**
 * @param from start vertex
 * @param getNeighbours function returning direct neighbours of a vertex
 * @return pairs (vertex, distance) for every reachable vertex in the order
 * of visiting, i.e. with non-decreasing distances; @a from comes first with
 * distance @c 0
 */
template < class T >
vector< pair< T, size_t > > getDistancesFrom(const T& from, const NeighboursFunction< T >& getNeighbours)
{
	vector< pair< T, size_t > > result;

	queue< T > currentVertices;
	currentVertices.push(from);

	map< T, size_t > distances = { { from, 0 } };
	result.push_back({ from, 0 });

	while (!currentVertices.empty())
	{
		auto currentVertex = currentVertices.front();
		currentVertices.pop();
		auto nextDistance = distances[currentVertex] + 1;

		for (const T& neighbour: getNeighbours(currentVertex))
		{
			if (distances.insert({ neighbour, nextDistance }).second)
			{
				result.push_back({ neighbour, nextDistance });
				currentVertices.push(neighbour);
			}
		}
	}

	return result;
}

}
}

#endif
