/**************************************************************************
*   Copyright (C) 2010 by Eugene V. Lyubimkin                             *
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
#ifndef COMMON_SEEN
#define COMMON_SEEN

#include <map>
using std::map;
#include <set>
using std::set;

#include <abstractor/common.hpp>
#include <abstractor/config.hpp>
#include <abstractor/package.hpp>
#include <abstractor/packagecollection.hpp>

using namespace abstractor;

typedef PackageDetails::RelationTypes RT;
typedef PackageCollection::Tier Tier;

// exact identifier or its unique prefix
string getIdentifierByPrefix(const PackageCollection&, const string& prefix);

// rescales x from [minX, maxX] to [a, b]; the middle of [a, b] if minX == maxX
double minMaxNormalize(double x, double minX, double maxX, double a = 0, double b = 1);

// widths outside [1, maxBarWidth] are fatal; 'source' names where the width came from
const ssize_t maxBarWidth = 1000;
size_t checkBarWidth(ssize_t width, const string& source);

// only relations to present packages
vector< string > getPresentRelations(const PackageCollection&, const string& identifier,
		RT::Type relationType);

#endif
