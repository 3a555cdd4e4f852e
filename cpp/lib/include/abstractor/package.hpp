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
#ifndef ABSTRACTOR_PACKAGE_SEEN
#define ABSTRACTOR_PACKAGE_SEEN

/// @file

#include <set>

#include <abstractor/common.hpp>

namespace abstractor {

using std::set;

/// installed package record
struct ABSTRACTOR_API PackageDetails
{
	/// relation types
	struct RelationTypes
	{
		/// type
		enum Type {
			Requires, ///< mandatory dependency
			Advises, ///< optional (recommended) dependency
			Suggests, ///< metadata only
			Supplements, ///< metadata only
			Enhances, ///< metadata only
			Count };
		/// string values of corresponding types
		static const string strings[];
	};

	/// cost shares relative to the total attributed bytes
	struct CostRatios
	{
		double installed; ///< own installed size
		double mandatory; ///< mandatory pseudobytes
		double optional; ///< optional pseudobytes
	};

	/// @name display metadata
	/// @{
	string name;
	string description;
	string category;
	string variety;
	string installation;
	/// @}

	/// direct relations, per relation type; duplicates are allowed
	vector< string > relations[RelationTypes::Count];

	uint64_t installedBytes; ///< own on-disk footprint

	/// @name computed by closure computation
	/// @{
	set< string > recursiveRequires; ///< reachable via 'requires' edges, excluding self
	/// reachable via 'requires' or 'advises' edges, excluding self and @ref recursiveRequires
	set< string > recursiveComplements;
	set< string > recursiveWhatRequires; ///< whose @ref recursiveRequires contain this package
	set< string > recursiveWhatComplements; ///< whose @ref recursiveComplements contain this package
	/// @}

	/// @name computed by cost attribution
	/// @{
	size_t claimantCount; ///< number of upper-tier claimants (lower-tier packages only)
	double mandatoryPseudobytes; ///< cost received via mandatory relations
	double optionalPseudobytes; ///< cost received via optional relations
	/// @}

	PackageDetails();

	/// sum of mandatory and optional pseudobytes
	double getTotalPseudobytes() const;
	/// sum of own installed size and pseudobytes
	double getTotalAttributedBytes() const;
	/// computes cost ratios
	/**
	 * @param [out] ratios
	 * @return @c false if the total attributed size is zero and ratios are
	 * not defined, @c true otherwise
	 */
	bool getCostRatios(CostRatios* ratios) const;
	/// clears all computed fields
	void clearComputedFields();
};

}

#endif
