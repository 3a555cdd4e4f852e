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
#ifndef RENDERERS_SEEN
#define RENDERERS_SEEN

#include <iosfwd>

#include "common.hpp"

// accumulates DOT statements, prints them sorted
class DotGraph
{
	vector< string > __nodes;
	vector< string > __edges;
 public:
	typedef vector< pair< string, string > > Attributes;

	void addNode(const string& identifier, const Attributes&);
	void addEdge(const string& from, const string& to, const Attributes&);
	void print(std::ostream&) const;
};

void renderDotGraph(const PackageCollection&, size_t cutOff, std::ostream&);
vector< string > renderBarGraph(const PackageCollection&, size_t width);
vector< string > renderDetails(const PackageCollection&, const string& identifier, size_t width);
// all packages if 'tier' is NULL
vector< string > renderPackageList(const PackageCollection&, const Tier* tier);
// in the configuration file syntax, empty scalar options are skipped
vector< string > renderConfig(const Config&);

#endif
