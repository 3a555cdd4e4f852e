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

static vector< string > __get_upper_members(const PackageCollection& collection,
		const set< string >& identifiers)
{
	vector< string > result;
	for (const string& identifier: identifiers)
	{
		if (collection.isUpper(identifier))
		{
			result.push_back(identifier);
		}
	}
	return result;
}

void computePseudobytes(PackageCollection& collection)
{
	typedef PackageCollection::Tier Tier;

	auto upperIdentifiers = collection.getIdentifiers(Tier::Upper);
	FORIT(identifierIt, upperIdentifiers)
	{
		auto& details = collection.get(*identifierIt);
		details.mandatoryPseudobytes = 0;
		details.optionalPseudobytes = 0;
	}

	auto lowerIdentifiers = collection.getIdentifiers(Tier::Lower);
	FORIT(identifierIt, lowerIdentifiers)
	{
		auto& details = collection.get(*identifierIt);

		auto mandatoryClaimants = __get_upper_members(collection, details.recursiveWhatRequires);
		auto optionalClaimants = __get_upper_members(collection, details.recursiveWhatComplements);

		details.claimantCount = mandatoryClaimants.size() + optionalClaimants.size();
		if (!details.claimantCount)
		{
			continue; // disconnected, nobody pays for it
		}

		double share = double(details.installedBytes) / details.claimantCount;
		FORIT(claimantIt, mandatoryClaimants)
		{
			collection.get(*claimantIt).mandatoryPseudobytes += share;
		}
		FORIT(claimantIt, optionalClaimants)
		{
			collection.get(*claimantIt).optionalPseudobytes += share;
		}
	}
}

}
}
