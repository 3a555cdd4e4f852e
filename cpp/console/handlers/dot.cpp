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

#include "../handlers.hpp"
#include "../renderers.hpp"

int showDotGraph(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	parseOptions(context, bpo::options_description(""), arguments);
	checkNoExtraArguments(arguments);

	auto cutOff = config->getInteger("abstractor::dot::cut-off");
	if (cutOff < 1)
	{
		fatal2(__("the option '%s' should be positive"), "abstractor::dot::cut-off");
	}

	renderDotGraph(*context.getPackageCollection(), cutOff, cout);

	return 0;
}
