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
#include <algorithm>
#include <cstring>

#include <common/regex.hpp>

#include <abstractor/collector.hpp>

#include "common.hpp"
#include "misc.hpp"
#include "handlers.hpp"

string parseCommonOptions(int argc, char** argv, Config& config, vector< string >& unparsed)
{
	string command;
	// parsing
	bpo::options_description options("Common options");
	vector< string > directOptions;
	string collectorName;
	string recordsPath;
	string postProcessing;
	options.add_options()
		("option,o", bpo::value< vector< string > >(&directOptions))
		("collector,c", bpo::value< string >(&collectorName))
		("records,r", bpo::value< string >(&recordsPath))
		("post-process,p", bpo::value< string >(&postProcessing))
		("debug,d", "")
		("command", bpo::value< string >(&command))
		("arguments", bpo::value< vector< string > >());

	bpo::positional_options_description positionalOptions;
	positionalOptions.add("command", 1);
	positionalOptions.add("arguments", -1);

	try
	{
		bpo::variables_map variablesMap;
		bpo::parsed_options parsed = bpo::command_line_parser(argc, argv).options(options)
				.style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
				.positional(positionalOptions).allow_unregistered().run();
		bpo::store(parsed, variablesMap);
		bpo::notify(variablesMap);

		{ // do not pass 'command' further
			auto commandOptionIt = std::find_if(parsed.options.begin(), parsed.options.end(),
					[](const bpo::option& o) { return o.string_key == "command"; });
			if (commandOptionIt != parsed.options.end())
			{
				parsed.options.erase(commandOptionIt);
			}
		}
		unparsed = bpo::collect_unrecognized(parsed.options, bpo::include_positional);

		{ // processing
			if (command.empty())
			{
				fatal2(__("no command specified"));
			}
			if (!recordsPath.empty())
			{
				config.setScalar("abstractor::collector", "records");
				config.setScalar("abstractor::records::path", recordsPath);
			}
			if (!collectorName.empty())
			{
				config.setScalar("abstractor::collector", collectorName);
			}
			if (!postProcessing.empty())
			{
				config.setScalar("abstractor::post-process", postProcessing);
			}
			if (variablesMap.count("debug"))
			{
				config.setScalar("debug::analysis", "yes");
				config.setScalar("debug::collector", "yes");
			}
		}

		smatch m;
		for (const string& directOption: directOptions)
		{
			static const sregex optionRegex = sregex::compile("(.*?)=(.*)");
			if (!regex_match(directOption, m, optionRegex))
			{
				fatal2(__("invalid option syntax in '%s' (right is '<option>=<value>')"), directOption);
			}
			string key = m[1];
			string value = m[2];

			static const sregex listOptionNameRegex = sregex::compile("(.*?)::");
			if (regex_match(key, m, listOptionNameRegex))
			{
				// this is list option
				config.setList(m[1], value);
			}
			else
			{
				// regular option
				config.setScalar(key, value);
			}
		}
	}
	catch (const bpo::error& e)
	{
		fatal2(__("failed to parse command-line options: %s"), e.what());
	}
	catch (Exception&)
	{
		fatal2(__("error while processing command-line options"));
	}
	return command;
}

bpo::variables_map parseOptions(const Context& context, bpo::options_description options,
		vector< string >& arguments)
{
	bpo::options_description argumentOptions("");
	argumentOptions.add_options()
		("arguments", bpo::value< vector< string > >(&arguments));

	bpo::options_description all("");
	all.add(options);
	all.add(argumentOptions);

	bpo::positional_options_description positionalOptions;
	positionalOptions.add("arguments", -1);

	bpo::variables_map variablesMap;
	try
	{
		bpo::parsed_options parsed = bpo::command_line_parser(context.unparsed)
				.style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
				.options(all).positional(positionalOptions).run();
		bpo::store(parsed, variablesMap);
	}
	catch (const bpo::unknown_option& e)
	{
		fatal2(__("unknown option '%s'"), e.get_option_name());
	}
	catch (const bpo::error& e)
	{
		fatal2(__("failed to parse command-line options: %s"), e.what());
	}
	bpo::notify(variablesMap);

	return variablesMap;
}

std::function< int (Context&) > getHandler(const string& command)
{
	static map< string, std::function< int (Context&) > > handlerMap = {
		{ "dot", &showDotGraph },
		{ "bar", &showBarGraph },
		{ "details", &showDetails },
		{ "list", &listPackages },
		{ "config-dump", &dumpConfig },
	};
	auto it = handlerMap.find(command);
	if (it == handlerMap.end())
	{
		fatal2(__("unrecognized command '%s'"), command);
	}
	return it->second;
}

void checkNoExtraArguments(const vector< string >& arguments)
{
	if (!arguments.empty())
	{
		auto argumentsString = join(" ", arguments);
		warn2(__("extra arguments '%s' are not processed"), argumentsString);
	}
}

shared_ptr< Config > Context::getConfig()
{
	if (!__config)
	{
		try
		{
			__config.reset(new Config);
		}
		catch (Exception&)
		{
			fatal2(__("error while loading the configuration"));
		}
	}
	return __config;
}

shared_ptr< const PackageCollection > Context::getPackageCollection()
{
	if (!__package_collection)
	{
		auto config = getConfig();
		try
		{
			auto collector = Collector::create(*config);
			__package_collection = manufacturePackageCollection(*config, *collector);
		}
		catch (Exception&)
		{
			fatal2(__("error while analysing installed packages"));
		}
	}
	return __package_collection;
}
