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
#include <common/common.hpp>

#include <abstractor/analysis.hpp>
#include <abstractor/graph.hpp>
#include <abstractor/packagecollection.hpp>

namespace abstractor {
namespace analysis {

namespace {

typedef PackageDetails::RelationTypes RT;

// only identifiers present in the collection take part in the traversal
vector< string > getPresentNeighbours(const PackageCollection& collection,
		const string& identifier, bool withAdvises)
{
	vector< string > result;

	const PackageDetails& details = collection.get(identifier);
	for (const string& neighbour: details.relations[RT::Requires])
	{
		if (collection.contains(neighbour))
		{
			result.push_back(neighbour);
		}
	}
	if (withAdvises)
	{
		for (const string& neighbour: details.relations[RT::Advises])
		{
			if (collection.contains(neighbour))
			{
				result.push_back(neighbour);
			}
		}
	}

	return result;
}

}

void computeRecursiveDependencies(PackageCollection& collection)
{
	auto identifiers = collection.getIdentifiers();

	FORIT(identifierIt, identifiers)
	{
		auto& details = collection.get(*identifierIt);
		details.recursiveRequires.clear();
		details.recursiveComplements.clear();
		details.recursiveWhatRequires.clear();
		details.recursiveWhatComplements.clear();
	}

	graph::NeighboursFunction< string > getMandatoryNeighbours =
			[&collection](const string& identifier)
			{
				return getPresentNeighbours(collection, identifier, false);
			};
	graph::NeighboursFunction< string > getAllNeighbours =
			[&collection](const string& identifier)
			{
				return getPresentNeighbours(collection, identifier, true);
			};

	FORIT(identifierIt, identifiers)
	{
		const string& identifier = *identifierIt;

		auto mandatory = graph::getReachableFrom(identifier, getMandatoryNeighbours);
		mandatory.erase(identifier);

		auto complements = graph::getReachableFrom(identifier, getAllNeighbours);
		complements.erase(identifier);
		for (const string& mandatoryDependency: mandatory)
		{
			complements.erase(mandatoryDependency);
		}

		for (const string& dependency: mandatory)
		{
			collection.get(dependency).recursiveWhatRequires.insert(identifier);
		}
		for (const string& dependency: complements)
		{
			collection.get(dependency).recursiveWhatComplements.insert(identifier);
		}

		auto& details = collection.get(identifier);
		details.recursiveRequires.swap(mandatory);
		details.recursiveComplements.swap(complements);
	}
}

}
}
