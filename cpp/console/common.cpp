/**************************************************************************
*   Copyright (C) 2012 by Eugene V. Lyubimkin                             *
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
#include "common.hpp"

string getIdentifierByPrefix(const PackageCollection& collection, const string& prefix)
{
	if (collection.contains(prefix))
	{
		return prefix;
	}

	vector< string > candidates;
	for (const string& identifier: collection.getIdentifiers())
	{
		if (identifier.compare(0, prefix.size(), prefix) == 0)
		{
			candidates.push_back(identifier);
		}
	}

	if (candidates.empty())
	{
		fatal2(__("no package matches '%s'"), prefix);
	}
	if (candidates.size() > 1)
	{
		fatal2(__("the prefix '%s' is ambiguous, candidates are: %s"), prefix, join(", ", candidates));
	}
	return candidates[0];
}

double minMaxNormalize(double x, double minX, double maxX, double a, double b)
{
	if (minX == maxX)
	{
		return (a + b) / 2;
	}
	return a + (x - minX) * (b - a) / (maxX - minX);
}

size_t checkBarWidth(ssize_t width, const string& source)
{
	if (width < 1 || width > maxBarWidth)
	{
		fatal2(__("the bar width %zd from '%s' is not in the range [1, %zd]"), width, source, maxBarWidth);
	}
	return width;
}

vector< string > getPresentRelations(const PackageCollection& collection, const string& identifier,
		RT::Type relationType)
{
	vector< string > result;
	for (const string& relation: collection.get(identifier).relations[relationType])
	{
		if (collection.contains(relation))
		{
			result.push_back(relation);
		}
	}
	return result;
}
