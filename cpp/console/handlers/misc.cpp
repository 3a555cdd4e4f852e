/**************************************************************************
*   Copyright (C) 2010-2011 by Eugene V. Lyubimkin                        *
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
#include <iostream>
using std::cout;
using std::endl;

#include "../common.hpp"
#include "../handlers.hpp"
#include "../renderers.hpp"

int listPackages(Context& context)
{
	vector< string > arguments;
	parseOptions(context, bpo::options_description(""), arguments);

	bool onlyOneTier = false;
	Tier tier = Tier::Upper;
	if (!arguments.empty())
	{
		const string& tierString = arguments[0];
		if (tierString == PackageCollection::tierStrings[int(Tier::Upper)])
		{
			tier = Tier::Upper;
		}
		else if (tierString == PackageCollection::tierStrings[int(Tier::Lower)])
		{
			tier = Tier::Lower;
		}
		else
		{
			fatal2(__("wrong tier '%s'"), tierString);
		}
		onlyOneTier = true;
		arguments.erase(arguments.begin());
	}
	checkNoExtraArguments(arguments);

	for (const string& line: renderPackageList(*context.getPackageCollection(), onlyOneTier ? &tier : NULL))
	{
		cout << line << endl;
	}

	return 0;
}

int dumpConfig(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	parseOptions(context, bpo::options_description(""), arguments);
	checkNoExtraArguments(arguments);

	for (const string& line: renderConfig(*config))
	{
		cout << line << endl;
	}

	return 0;
}
