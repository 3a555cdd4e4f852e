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
#include <iostream>
using std::cout;
using std::endl;

#include "../handlers.hpp"
#include "../renderers.hpp"

int showDetails(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	parseOptions(context, bpo::options_description(""), arguments);
	if (arguments.empty())
	{
		fatal2(__("no package specified"));
	}
	auto prefix = arguments[0];
	arguments.erase(arguments.begin());
	checkNoExtraArguments(arguments);

	const char* widthOptionName = "abstractor::console::details-bar-width";
	auto width = checkBarWidth(config->getInteger(widthOptionName), widthOptionName);

	auto collection = context.getPackageCollection();
	auto identifier = getIdentifierByPrefix(*collection, prefix);

	for (const string& line: renderDetails(*collection, identifier, width))
	{
		cout << line << endl;
	}

	if (config->getBool("debug::analysis"))
	{
		const auto& details = collection->get(identifier);
		debug2("%s: tier %s, %zu recursive requirements, %zu recursive complements, "
				"%zu claimants, %.1f mandatory and %.1f optional pseudobytes",
				identifier, PackageCollection::tierStrings[int(collection->getTier(identifier))],
				details.recursiveRequires.size(), details.recursiveComplements.size(),
				details.claimantCount, details.mandatoryPseudobytes, details.optionalPseudobytes);
	}

	return 0;
}
