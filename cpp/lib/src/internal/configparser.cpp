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
#include <sys/types.h>

#include <algorithm>

#include <abstractor/file.hpp>

#include <internal/configparser.hpp>

namespace abstractor {
namespace internal {

ConfigParser::ConfigParser(Handler regularHandler, Handler listHandler, Handler clearHandler)
	: __regular_handler(regularHandler), __list_handler(listHandler),
	__clear_handler(clearHandler)
{}

void ConfigParser::parse(const string& path)
{
	string block;
	{
		RequiredFile file(path, "r");
		file.getFile(block);
	}

	try
	{
		parseString(block);
	}
	catch (Exception&)
	{
		fatal2(__("unable to parse the config file '%s'"), path);
	}
}

void ConfigParser::parseString(const string& content)
{
	__option_prefix = "";
	__expected.clear();
	__current = __begin = content.begin();
	__end = content.end();
	__skip_spaces_and_comments();

	__statements();
	if (__current != __end)
	{
		__error_out();
	}
}

void ConfigParser::__statements()
{
	while (__statement()) {}
}

bool ConfigParser::__statement()
{
	return __clear() || __option();
}

bool ConfigParser::__clear()
{
	if (!__accept(Lexem::Clear))
	{
		return false;
	}
	if (!__accept(Lexem::Name))
	{
		__error_out();
	}
	string name = __read;
	if (!__accept(Lexem::Semicolon))
	{
		__error_out();
	}
	__clear_handler(__option_prefix + name, "");
	return true;
}

bool ConfigParser::__option()
{
	if (!__accept(Lexem::Name))
	{
		return false;
	}
	string name = __read;

	if (__accept(Lexem::Value))
	{
		__regular_handler(__option_prefix + name, __read);
	}
	else
	{
		// nested or list
		if (!__accept(Lexem::OpeningBracket))
		{
			__error_out();
		}

		bool listFound = false;
		while (__accept(Lexem::Value))
		{
			listFound = true;
			string value = __read;
			if (!__accept(Lexem::Semicolon))
			{
				__error_out();
			}
			__list_handler(__option_prefix + name, value);
		}

		if (!listFound)
		{
			string oldOptionPrefix = __option_prefix;
			__option_prefix += name + "::";
			__statements();
			__option_prefix = oldOptionPrefix;
		}

		if (!__accept(Lexem::ClosingBracket))
		{
			__error_out();
		}
	}

	if (!__accept(Lexem::Semicolon))
	{
		__error_out();
	}
	return true;
}

bool ConfigParser::__accept(Lexem lexem)
{
	static const sregex nameRegex = sregex::compile("(?:[\\w/.-]+::)*[\\w/.-]+",
			regex_constants::not_dot_newline);
	static const sregex valueRegex = sregex::compile("\".*?\"", regex_constants::not_dot_newline);

	sci previous = __current;
	bool accepted = false;

	auto acceptString = [this, &accepted](const string& str)
	{
		if (__end - __current >= ssize_t(str.size()) && std::equal(str.begin(), str.end(), __current))
		{
			__current += str.size();
			accepted = true;
		}
	};
	auto acceptRegex = [this, &accepted](const sregex& regex)
	{
		smatch m;
		if (regex_search(__current, __end, m, regex, regex_constants::match_continuous))
		{
			__current = m[0].second;
			accepted = true;
		}
	};

	switch (lexem)
	{
		case Lexem::Clear: acceptString("#clear"); break;
		case Lexem::Name: acceptRegex(nameRegex); break;
		case Lexem::Value: acceptRegex(valueRegex); break;
		case Lexem::Semicolon: acceptString(";"); break;
		case Lexem::OpeningBracket: acceptString("{"); break;
		case Lexem::ClosingBracket: acceptString("}"); break;
	}

	if (!accepted)
	{
		__expected.push_back(lexem);
		return false;
	}

	__read.assign(previous, __current);
	if (lexem == Lexem::Value)
	{
		// unquoting
		__read = __read.substr(1, __read.size() - 2);
	}
	__skip_spaces_and_comments();
	__expected.clear();
	return true;
}

void ConfigParser::__skip_spaces_and_comments()
{
	static const sregex skipRegex = sregex::compile(
			"(?:" "\\s+" "|" "(?:#\\s|//).*$" ")+", regex_constants::not_dot_newline);
	smatch m;
	if (regex_search(__current, __end, m, skipRegex, regex_constants::match_continuous))
	{
		__current = m[0].second;
	}
}

string ConfigParser::__get_lexem_description(Lexem lexem)
{
	switch (lexem)
	{
		case Lexem::Clear: return __("clear directive ('#clear')");
		case Lexem::ClosingBracket: return __("closing curly bracket ('}')");
		case Lexem::OpeningBracket: return __("opening curly bracket ('{')");
		case Lexem::Semicolon: return __("semicolon (';')");
		case Lexem::Value: return __("option value (quoted string)");
		case Lexem::Name: return __("option name (letters, numbers, slashes, points, dashes, double colons allowed)");
	}
	return string(); // unreachable
}

void ConfigParser::__error_out()
{
	vector< string > lexemDescriptions;
	std::transform(__expected.begin(), __expected.end(),
			std::back_inserter(lexemDescriptions), __get_lexem_description);
	string errorDescription = join(" or ", lexemDescriptions);

	size_t lineNumber = std::count(__begin, __current, '\n') + 1;
	size_t charNumber = 1;
	for (auto it = __current; it != __begin && *(it-1) != '\n'; --it)
	{
		++charNumber;
	}

	fatal2(__("syntax error: line %zu, character %zu: expected: %s"),
			lineNumber, charNumber, errorDescription);
}

} // namespace
} // namespace
