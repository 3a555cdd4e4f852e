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
#ifndef ABSTRACTOR_ANALYSIS_SEEN
#define ABSTRACTOR_ANALYSIS_SEEN

/// @file

#include <abstractor/common.hpp>
#include <abstractor/fwd.hpp>

namespace abstractor {
namespace analysis {

/// computes transitive dependency closures and their reverse indexes
/**
 * Fills PackageDetails::recursiveRequires, PackageDetails::recursiveComplements,
 * PackageDetails::recursiveWhatRequires and PackageDetails::recursiveWhatComplements
 * for every package. Relations pointing outside the collection are ignored.
 * Previously computed values are discarded.
 */
ABSTRACTOR_API void computeRecursiveDependencies(PackageCollection&);

/// distributes installed sizes of lower-tier packages over their upper-tier claimants
/**
 * Requires computed closures. Fills PackageDetails::claimantCount for lower-tier
 * packages and pseudobytes for upper-tier packages.
 */
ABSTRACTOR_API void computePseudobytes(PackageCollection&);

/// @return lower-tier identifiers not reachable from any upper-tier package, sorted
ABSTRACTOR_API vector< string > getDisconnected(const PackageCollection&);

/// removes all disconnected lower-tier packages
/**
 * @return removed identifiers, sorted
 */
ABSTRACTOR_API vector< string > prune(PackageCollection&);

/// moves disconnected lower-tier packages which are not dependencies of other disconnected ones to the upper tier
/**
 * @return moved identifiers, sorted
 */
ABSTRACTOR_API vector< string > promote(PackageCollection&);

/// tier reclassification policy
struct ABSTRACTOR_API PostProcessing
{
	/// type
	enum Type { None, Prune, Promote };
	/// string values of corresponding types
	static const char* strings[];
	/// @return type by its string value; throws on unknown values
	static Type fromString(const string&);
};

/// applies the reclassification policy
/**
 * @return affected identifiers, sorted
 */
ABSTRACTOR_API vector< string > postProcess(PackageCollection&, PostProcessing::Type);

}
}

#endif
