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
#ifndef ABSTRACTOR_TESTS_HELPERS_SEEN
#define ABSTRACTOR_TESTS_HELPERS_SEEN

#include <abstractor/common.hpp>
#include <abstractor/package.hpp>
#include <abstractor/packagecollection.hpp>

namespace abstractor {
namespace tests {

typedef PackageCollection::Tier Tier;
typedef PackageDetails::RelationTypes RT;

PackageDetails makeDetails(uint64_t installedBytes,
		const vector< string >& mandatory = vector< string >(),
		const vector< string >& advised = vector< string >());

// sum of installed sizes of upper-tier packages and connected lower-tier ones
double getConnectedInstalledBytes(const PackageCollection&);
double getUpperAttributedBytes(const PackageCollection&);

// creates a fresh directory, removes it with all contents on destruction
class TemporaryDirectory
{
	string __path;

	TemporaryDirectory(const TemporaryDirectory&);
	TemporaryDirectory& operator=(const TemporaryDirectory&);
 public:
	TemporaryDirectory();
	~TemporaryDirectory();

	const string& getPath() const;
	// writes the file under the directory, creating intermediate directories
	string writeFile(const string& relativePath, const string& content) const;
};

}
}

#endif
