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
#ifndef ABSTRACTOR_PACKAGECOLLECTION_SEEN
#define ABSTRACTOR_PACKAGECOLLECTION_SEEN

/// @file

#include <abstractor/common.hpp>
#include <abstractor/package.hpp>

namespace abstractor {

namespace internal {

struct PackageCollectionImpl;

}

/// two-tier package registry
/**
 * Every package identifier belongs to exactly one tier. Lookups work across
 * both tiers, iteration is lexicographic by identifier.
 *
 * All operations referencing an absent identifier (or, for @ref put, an
 * existing one) throw Exception.
 */
class ABSTRACTOR_API PackageCollection
{
	internal::PackageCollectionImpl* __impl;
 public:
	/// tier
	enum class Tier {
		Upper, ///< explicitly wanted packages
		Lower ///< packages present to support others
	};
	/// string values of tiers
	static const char* tierStrings[];

	PackageCollection();
	PackageCollection(const PackageCollection&);
	PackageCollection& operator=(const PackageCollection&);
	virtual ~PackageCollection();

	/// @return pointer to the record, or @c nullptr if there is no such identifier
	const PackageDetails* find(const string& identifier) const;
	/// @copydoc find
	PackageDetails* find(const string& identifier);
	/// @return the record; throws if there is no such identifier
	const PackageDetails& get(const string& identifier) const;
	/// @copydoc get
	PackageDetails& get(const string& identifier);
	bool contains(const string& identifier) const;
	/// @return the tier of the identifier; throws if there is no such identifier
	Tier getTier(const string& identifier) const;
	/// @return @c true if the identifier is present in the upper tier
	bool isUpper(const string& identifier) const;
	size_t size() const;

	/// inserts a new record
	/**
	 * Throws if the identifier is already present in any tier.
	 */
	void put(Tier tier, const string& identifier, const PackageDetails& details);
	/// replaces the record of the existing identifier, keeping its tier
	void set(const string& identifier, const PackageDetails& details);
	/// deletes the record
	void remove(const string& identifier);
	/// transfers the record to the tier @a targetTier without altering it
	void move(const string& identifier, Tier targetTier);

	/// @return all identifiers, sorted
	vector< string > getIdentifiers() const;
	/// @return identifiers of the tier @a tier, sorted
	vector< string > getIdentifiers(Tier tier) const;
};

}

#endif
