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
#include <cctype>
#include <cstdlib>
#include <map>
using std::map;

#include <boost/lexical_cast.hpp>

#include <common/common.hpp>
#include <common/regex.hpp>

#include <abstractor/config.hpp>

#include <internal/configparser.hpp>
#include <internal/filesystem.hpp>

namespace abstractor {

namespace internal {

struct ConfigImpl
{
	map< string, string > regularVars;
	map< string, vector< string > > listVars;

	void initializeVariables();
	void readConfigs(Config*);
};

void ConfigImpl::initializeVariables()
{
	regularVars =
	{
		{ "dir", "/" },
		{ "dir::etc", "etc/dependency-abstractor" },
		{ "dir::etc::main", "abstractor.conf" },
		{ "dir::etc::parts", "abstractor.conf.d" },
		{ "dir::state", "var/lib" },
		{ "dir::state::status", "dpkg/status" },
		{ "dir::state::extendedstates", "apt/extended_states" },
		{ "dir::log", "var/log" },
		{ "dir::log::history", "apt/history.log" },

		{ "abstractor::collector", "dpkg" },
		{ "abstractor::records::path", "" },
		{ "abstractor::post-process", "auto" },
		{ "abstractor::dot::cut-off", "2" },
		{ "abstractor::console::bar-width", "15" },
		{ "abstractor::console::details-bar-width", "10" },
		{ "abstractor::log", "no" },
		{ "abstractor::directory::log", "/var/log/dependency-abstractor.log" },
		{ "abstractor::log::levels::collection", "1" },
		{ "abstractor::log::levels::analysis", "1" },

		{ "debug::analysis", "no" },
		{ "debug::collector", "no" },
		{ "debug::logger", "no" },
	};

	listVars =
	{
		{ "abstractor::dpkg::system-priorities", vector< string > { "required", "important", "standard" } },
		{ "abstractor::dpkg::system-sections", vector< string > { "tasks" } },
		{ "abstractor::dpkg::support-sections", vector< string > { "libs" } },
	};
}

void ConfigImpl::readConfigs(Config* config)
{
	auto regularHandler = [config](const string& name, const string& value)
	{
		config->setScalar(name, value);
	};
	auto listHandler = [config](const string& name, const string& value)
	{
		config->setList(name, value);
	};
	auto clearHandler = [this](const string& name, const string& /* no value */)
	{
		FORIT(it, this->regularVars)
		{
			if (it->first.compare(0, name.size(), name) == 0)
			{
				it->second.clear();
			}
		}
		FORIT(it, this->listVars)
		{
			if (it->first.compare(0, name.size(), name) == 0)
			{
				it->second.clear();
			}
		}
	};

	internal::ConfigParser parser(regularHandler, listHandler, clearHandler);

	vector< string > configFiles = internal::fs::glob(config->getPath("dir::etc::parts") + "/*");
	{
		string mainFilePath = config->getPath("dir::etc::main");
		const char* envConfig = getenv("ABSTRACTOR_CONFIG");
		if (envConfig)
		{
			mainFilePath = envConfig;
		}
		if (internal::fs::fileExists(mainFilePath))
		{
			configFiles.push_back(mainFilePath);
		}
	}

	FORIT(configFileIt, configFiles)
	{
		try
		{
			parser.parse(*configFileIt);
		}
		catch (Exception&)
		{
			warn2(__("skipped the configuration file '%s'"), *configFileIt);
		}
	}
}

}

Config::Config()
{
	__impl = new internal::ConfigImpl;
	__impl->initializeVariables();
	__impl->readConfigs(this);
}

Config::~Config()
{
	delete __impl;
}

Config::Config(const Config& other)
{
	__impl = new internal::ConfigImpl(*other.__impl);
}

Config& Config::operator=(const Config& other)
{
	if (this == &other)
	{
		return *this;
	}
	delete __impl;
	__impl = new internal::ConfigImpl(*other.__impl);
	return *this;
}

vector< string > Config::getScalarOptionNames() const
{
	vector< string > result;
	FORIT(regularVariableIt, __impl->regularVars)
	{
		result.push_back(regularVariableIt->first);
	}
	return result;
}

vector< string > Config::getListOptionNames() const
{
	vector< string > result;
	FORIT(listVariableIt, __impl->listVars)
	{
		result.push_back(listVariableIt->first);
	}
	return result;
}

string Config::getString(const string& optionName) const
{
	auto it = __impl->regularVars.find(optionName);
	if (it == __impl->regularVars.cend())
	{
		fatal2(__("an attempt to get the wrong scalar option '%s'"), optionName);
	}
	return it->second;
}

string Config::getPath(const string& optionName) const
{
	auto shallowResult = getString(optionName);
	if (!shallowResult.empty() && shallowResult[0] != '/')
	{
		// relative path -> combine with prefix
		auto doubleColonPosition = optionName.rfind("::");
		if (doubleColonPosition != string::npos)
		{
			auto prefixOptionName = optionName.substr(0, doubleColonPosition);
			if (__impl->regularVars.find(prefixOptionName) != __impl->regularVars.cend())
			{
				return getPath(prefixOptionName) + '/' + shallowResult;
			}
		}
	}
	return shallowResult;
}

bool Config::getBool(const string& optionName) const
{
	auto result = getString(optionName);
	if (result.empty() || result == "false" || result == "0" || result == "no")
	{
		return false;
	}
	else
	{
		return true;
	}
}

ssize_t Config::getInteger(const string& optionName) const
{
	auto source = getString(optionName);
	if (source.empty())
	{
		return 0;
	}

	ssize_t result = 0;
	try
	{
		result = boost::lexical_cast< ssize_t >(source);
	}
	catch (boost::bad_lexical_cast&)
	{
		fatal2(__("unable to convert '%s' to a number"), source);
	}
	return result;
}

vector< string > Config::getList(const string& optionName) const
{
	auto it = __impl->listVars.find(optionName);
	if (it == __impl->listVars.end())
	{
		fatal2(__("an attempt to get the wrong list option '%s'"), optionName);
	}
	return it->second;
}

static string __normalize_option_name(const string& optionName)
{
	string result = optionName;
	FORIT(charIt, result)
	{
		*charIt = std::tolower(*charIt);
	}
	return result;
}

static bool __is_own_option(const string& optionName)
{
	static const sregex ownOptionRegex = sregex::compile("(?:abstractor|dir|debug)(?:::.*)?");
	smatch m;
	return regex_match(optionName, m, ownOptionRegex);
}

void Config::setScalar(const string& optionName, const string& value)
{
	auto normalizedOptionName = __normalize_option_name(optionName);

	if (__impl->regularVars.count(normalizedOptionName))
	{
		__impl->regularVars[normalizedOptionName] = value;
	}
	else if (__is_own_option(normalizedOptionName))
	{
		warn2(__("an attempt to set the wrong scalar option '%s'"), optionName);
	}
}

void Config::setList(const string& optionName, const string& value)
{
	auto normalizedOptionName = __normalize_option_name(optionName);

	if (__impl->listVars.count(normalizedOptionName))
	{
		__impl->listVars[normalizedOptionName].push_back(value);
	}
	else if (__is_own_option(normalizedOptionName))
	{
		warn2(__("an attempt to set the wrong list option '%s'"), optionName);
	}
}

} // namespace
