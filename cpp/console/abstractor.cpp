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
#include <clocale>
#include <cstring>
#include <iostream>
using std::cout;
using std::endl;

#include "abstractor.hpp"

void showOwnVersion();
void showHelp(const char*);

int main(int argc, char* argv[])
{
	setlocale(LC_ALL, "");
	abstractor::messageFd = STDERR_FILENO;

	if (argc > 1)
	{
		if (!strcmp(argv[1], "version") || !strcmp(argv[1], "--version") || !strcmp(argv[1], "-v"))
		{
			if (argc > 2)
			{
				warn2(__("the command '%s' doesn't accept arguments"), argv[1]);
			}
			showOwnVersion();
			return 0;
		}
		if (!strcmp(argv[1], "help") || !strcmp(argv[1], "--help") || !strcmp(argv[1], "-h"))
		{
			if (argc > 2)
			{
				warn2(__("the command '%s' doesn't accept arguments"), argv[1]);
			}
			showHelp(argv[0]);
			return 0;
		}
	}
	else
	{
		showHelp(argv[0]);
		return 0;
	}

	Context context;
	return mainEx(argc, argv, context);
}

int mainEx(int argc, char* argv[], Context& context)
{
	try
	{
		auto command = parseCommonOptions(argc, argv, /* in */ *context.getConfig(),
				/* out */ context.unparsed);
		context.argc = argc;
		context.argv = argv;
		std::function< int (Context&) > handler = getHandler(command);
		try
		{
			return handler(context);
		}
		catch (Exception&)
		{
			fatal2(__("error performing the command '%s'"), command);
		}
	}
	catch (Exception&)
	{
		return 1;
	}
	return 255; // we should not reach it
}

void showOwnVersion()
{
	#define QUOTED(x) QUOTED_(x)
	#define QUOTED_(x) # x
	cout << "executable: " << QUOTED(ABSTRACTOR_VERSION) << endl;
	#undef QUOTED
	#undef QUOTED_
	cout << "library: " << abstractor::libraryVersion << endl;
}

void showHelp(const char* argv0)
{
	map< string, string > actionDescriptions = {
		{ "help", __("prints a short help") },
		{ "version", __("prints versions of this program and the underlying library") },
		{ "config-dump", __("prints values of configuration variables") },
		{ "dot", __("prints the abstract dependency graph in the DOT language") },
		{ "bar", __("prints a bar graph of attributed sizes of explicitly installed packages") },
		{ "details", __("prints dependencies of the package with their sizes") },
		{ "list", __("prints packages with their tiers and sizes") },
	};

	cout << format2(__("Usage: %s <action> [<options>] [<parameters>]"), argv0) << endl;
	cout << endl;
	cout << __("Actions:") << endl;
	for (const auto& pair: actionDescriptions)
	{
		cout << "  " << pair.first << ": " << pair.second << endl;
	}
	cout << endl;
	cout << __("Common options:") << endl;
	cout << "  -o, --option <name>=<value>: " << __("sets the configuration option") << endl;
	cout << "  -c, --collector <records|dpkg>: " << __("selects the source of installed packages") << endl;
	cout << "  -r, --records <file>: " << __("reads packages from the record file") << endl;
	cout << "  -p, --post-process <auto|none|prune|promote>: " << __("selects the tier reclassification") << endl;
	cout << "  -d, --debug: " << __("prints debug messages") << endl;
	cout << endl;
	cout << format2(__("Example: %s dot | sfdp -Tsvg > packages.svg"), argv0) << endl;
}
