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
#include <abstractor/packagecollection.hpp>

namespace abstractor {
namespace analysis {

namespace {

template < typename PredicateT >
bool anyDependent(const PackageDetails& details, PredicateT predicate)
{
	for (const string& dependent: details.recursiveWhatRequires)
	{
		if (predicate(dependent)) return true;
	}
	for (const string& dependent: details.recursiveWhatComplements)
	{
		if (predicate(dependent)) return true;
	}
	return false;
}

}

vector< string > getDisconnected(const PackageCollection& collection)
{
	vector< string > result;

	auto lowerIdentifiers = collection.getIdentifiers(PackageCollection::Tier::Lower);
	FORIT(identifierIt, lowerIdentifiers)
	{
		const auto& details = collection.get(*identifierIt);
		bool isConnected = anyDependent(details, [&collection](const string& dependent)
				{
					return collection.isUpper(dependent);
				});
		if (!isConnected)
		{
			result.push_back(*identifierIt);
		}
	}

	return result;
}

vector< string > prune(PackageCollection& collection)
{
	auto disconnected = getDisconnected(collection);
	if (disconnected.empty())
	{
		return disconnected;
	}

	FORIT(identifierIt, disconnected)
	{
		collection.remove(*identifierIt);
	}

	/* a removed package is not reachable from any surviving one, otherwise it
	   would have been connected, so only reverse indexes may mention it */
	auto survivors = collection.getIdentifiers();
	FORIT(survivorIt, survivors)
	{
		auto& details = collection.get(*survivorIt);
		FORIT(identifierIt, disconnected)
		{
			details.recursiveWhatRequires.erase(*identifierIt);
			details.recursiveWhatComplements.erase(*identifierIt);
		}
	}

	return disconnected;
}

vector< string > promote(PackageCollection& collection)
{
	vector< string > result;

	auto disconnectedList = getDisconnected(collection);
	const set< string > disconnected(disconnectedList.begin(), disconnectedList.end());

	FORIT(identifierIt, disconnectedList)
	{
		const auto& details = collection.get(*identifierIt);
		bool isSupportOfOrphan = anyDependent(details, [&disconnected](const string& dependent)
				{
					return disconnected.count(dependent) != 0;
				});
		if (!isSupportOfOrphan)
		{
			result.push_back(*identifierIt);
		}
	}

	FORIT(identifierIt, result)
	{
		collection.move(*identifierIt, PackageCollection::Tier::Upper);
	}

	return result;
}

const char* PostProcessing::strings[] = { "none", "prune", "promote" };

PostProcessing::Type PostProcessing::fromString(const string& input)
{
	for (size_t i = 0; i < sizeof(strings) / sizeof(strings[0]); ++i)
	{
		if (input == strings[i])
		{
			return static_cast< Type >(i);
		}
	}
	fatal2(__("wrong post-processing type '%s'"), input);
	__builtin_unreachable();
}

vector< string > postProcess(PackageCollection& collection, PostProcessing::Type type)
{
	switch (type)
	{
		case PostProcessing::None:
			return vector< string >();
		case PostProcessing::Prune:
			return prune(collection);
		case PostProcessing::Promote:
			return promote(collection);
	}
	fatal2i("wrong post-processing type %d", int(type));
	__builtin_unreachable();
}

}
}
