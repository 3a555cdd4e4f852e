/**************************************************************************
*   Copyright (C) 2010 by Eugene V. Lyubimkin                             *
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
#ifndef ABSTRACTOR_INTERNAL_CONFIGPARSER_SEEN
#define ABSTRACTOR_INTERNAL_CONFIGPARSER_SEEN

#include <functional>

#include <common/regex.hpp>

#include <abstractor/common.hpp>

namespace abstractor {
namespace internal {

// parser of APT-style configuration files:
//
//   name "value";
//   name::subname "value";
//   group { name "value"; };
//   list { "value1"; "value2"; };
//   #clear name;
class ConfigParser
{
 public:
	typedef std::function< void (const string&, const string&) > Handler;
 private:
	typedef string::const_iterator sci;

	enum class Lexem { Clear, Name, Value, Semicolon, OpeningBracket, ClosingBracket };

	Handler __regular_handler;
	Handler __list_handler;
	Handler __clear_handler;

	sci __begin;
	sci __end;
	sci __current;
	vector< Lexem > __expected;
	string __read;
	string __option_prefix;

	void __statements();
	bool __statement();
	bool __clear();
	bool __option();
	bool __accept(Lexem);
	void __skip_spaces_and_comments();

	static string __get_lexem_description(Lexem);
	void __error_out();
 public:
	ConfigParser(Handler regularHandler, Handler listHandler, Handler clearHandler);
	void parse(const string& path);
	void parseString(const string& content);
};

} // namespace
} // namespace

#endif
