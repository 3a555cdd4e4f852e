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

#include <common/common.hpp>

#include <internal/common.hpp>

#include <abstractor/packagecollection.hpp>

namespace abstractor {

namespace internal {

struct PackageCollectionImpl
{
	struct Entry
	{
		PackageCollection::Tier tier;
		PackageDetails details;
	};
	std::map< string, Entry > entries;

	const Entry& getEntry(const string& identifier) const;
	Entry& getEntry(const string& identifier);
};

const PackageCollectionImpl::Entry& PackageCollectionImpl::getEntry(const string& identifier) const
{
	auto it = entries.find(identifier);
	if (it == entries.end())
	{
		fatal2(__("the package '%s' is not present in the collection"), identifier);
	}
	return it->second;
}

PackageCollectionImpl::Entry& PackageCollectionImpl::getEntry(const string& identifier)
{
	return const_cast< Entry& >(static_cast< const PackageCollectionImpl* >(this)->getEntry(identifier));
}

}

const char* PackageCollection::tierStrings[] = { N__("upper"), N__("lower") };

PackageCollection::PackageCollection()
	: __impl(new internal::PackageCollectionImpl)
{}

PackageCollection::PackageCollection(const PackageCollection& other)
	: __impl(new internal::PackageCollectionImpl(*other.__impl))
{}

PackageCollection& PackageCollection::operator=(const PackageCollection& other)
{
	if (this != &other)
	{
		*__impl = *other.__impl;
	}
	return *this;
}

PackageCollection::~PackageCollection()
{
	delete __impl;
}

const PackageDetails* PackageCollection::find(const string& identifier) const
{
	auto it = __impl->entries.find(identifier);
	return (it != __impl->entries.end()) ? &it->second.details : nullptr;
}

PackageDetails* PackageCollection::find(const string& identifier)
{
	auto it = __impl->entries.find(identifier);
	return (it != __impl->entries.end()) ? &it->second.details : nullptr;
}

const PackageDetails& PackageCollection::get(const string& identifier) const
{
	return __impl->getEntry(identifier).details;
}

PackageDetails& PackageCollection::get(const string& identifier)
{
	return __impl->getEntry(identifier).details;
}

bool PackageCollection::contains(const string& identifier) const
{
	return __impl->entries.count(identifier);
}

PackageCollection::Tier PackageCollection::getTier(const string& identifier) const
{
	return __impl->getEntry(identifier).tier;
}

bool PackageCollection::isUpper(const string& identifier) const
{
	auto it = __impl->entries.find(identifier);
	return it != __impl->entries.end() && it->second.tier == Tier::Upper;
}

size_t PackageCollection::size() const
{
	return __impl->entries.size();
}

void PackageCollection::put(Tier tier, const string& identifier, const PackageDetails& details)
{
	internal::PackageCollectionImpl::Entry entry = { tier, details };
	auto insertResult = __impl->entries.insert(std::make_pair(identifier, entry));
	if (!insertResult.second)
	{
		fatal2(__("the package '%s' is already present in the collection (%s tier)"),
				identifier, __(tierStrings[int(insertResult.first->second.tier)]));
	}
}

void PackageCollection::set(const string& identifier, const PackageDetails& details)
{
	__impl->getEntry(identifier).details = details;
}

void PackageCollection::remove(const string& identifier)
{
	if (!__impl->entries.erase(identifier))
	{
		fatal2(__("unable to remove the package '%s': it is not present in the collection"), identifier);
	}
}

void PackageCollection::move(const string& identifier, Tier targetTier)
{
	__impl->getEntry(identifier).tier = targetTier;
}

vector< string > PackageCollection::getIdentifiers() const
{
	vector< string > result;
	result.reserve(__impl->entries.size());
	FORIT(entryIt, __impl->entries)
	{
		result.push_back(entryIt->first);
	}
	return result;
}

vector< string > PackageCollection::getIdentifiers(Tier tier) const
{
	vector< string > result;
	FORIT(entryIt, __impl->entries)
	{
		if (entryIt->second.tier == tier)
		{
			result.push_back(entryIt->first);
		}
	}
	return result;
}

}
