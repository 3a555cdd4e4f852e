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

int showBarGraph(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	bpo::options_description options("");
	options.add_options()
		("width", bpo::value< ssize_t >());

	auto variables = parseOptions(context, options, arguments);
	checkNoExtraArguments(arguments);

	size_t width;
	if (variables.count("width"))
	{
		width = checkBarWidth(variables["width"].as< ssize_t >(), "--width");
	}
	else
	{
		const char* optionName = "abstractor::console::bar-width";
		width = checkBarWidth(config->getInteger(optionName), optionName);
	}

	for (const string& line: renderBarGraph(*context.getPackageCollection(), width))
	{
		cout << line << endl;
	}

	return 0;
}
