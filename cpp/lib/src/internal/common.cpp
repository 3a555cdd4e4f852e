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
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <map>

#include <boost/lexical_cast.hpp>

#include <internal/common.hpp>

namespace abstractor {
namespace internal {

void chomp(string& str)
{
	if (!str.empty() && *str.rbegin() == '\n') // the last character is newline
	{
		str.erase(str.end() - 1); // delete it
	}
}

string trim(const string& str)
{
	static const char* const blanks = " \t\n";
	auto first = str.find_first_not_of(blanks);
	if (first == string::npos)
	{
		return string();
	}
	auto last = str.find_last_not_of(blanks);
	return str.substr(first, last - first + 1);
}

vector< string > split(char c, const string& str, bool allowEmpty)
{
	vector< string > result;

	size_t size = str.size();
	size_t startPosition = 0;
	for (size_t i = 0; i < size; ++i)
	{
		if (str[i] == c)
		{
			if (startPosition < i || allowEmpty)
			{
				// there is non-empty substring (or empty one allowed)
				result.push_back(string(str, startPosition, i - startPosition));
			}
			startPosition = i + 1;
		}
	}
	if (startPosition < size || allowEmpty)
	{
		// there is non-empty last substring (or empty allowed)
		result.push_back(string(str, startPosition, size - startPosition));
	}

	return result;
}

uint64_t string2uint64(pair< string::const_iterator, string::const_iterator > input)
{
	char buf[24] = {0};
	size_t inputLength = input.second - input.first;
	if (inputLength >= sizeof(buf))
	{
		fatal2(__("too long number string"));
	}
	if (inputLength == 0)
	{
		fatal2(__("empty number string"));
	}
	memcpy(buf, &(*input.first), inputLength);
	if (buf[0] == '-')
	{
		fatal2(__("negative number '%s'"), buf);
	}
	char* end;
	errno = 0;
	unsigned long long number = strtoull(buf, &end, 10);
	if (errno)
	{
		fatal2e(__("invalid number '%s'"), buf);
	}
	if (*end != '\0')
	{
		fatal2(__("invalid number '%s'"), buf);
	}
	return uint64_t(number);
}

uint64_t humanToBytes(const string& input)
{
	static const std::map< string, double > units = {
		{ "B", 1 }, { "byte", 1 }, { "bytes", 1 },
		{ "kB", 1e3 }, { "MB", 1e6 }, { "GB", 1e9 }, { "TB", 1e12 },
		{ "PB", 1e15 }, { "EB", 1e18 },
		{ "KiB", 1024.0 }, { "kiB", 1024.0 },
		{ "MiB", 1048576.0 }, { "GiB", 1073741824.0 },
		{ "TiB", 1099511627776.0 }, { "PiB", 1125899906842624.0 },
		{ "EiB", 1152921504606846976.0 },
	};

	auto parts = split(' ', trim(input));
	if (parts.size() == 1)
	{
		return string2uint64(std::make_pair(parts[0].cbegin(), parts[0].cend()));
	}
	if (parts.size() != 2)
	{
		fatal2(__("invalid size '%s'"), input);
	}

	auto unitIt = units.find(parts[1]);
	if (unitIt == units.end())
	{
		fatal2(__("unknown size unit '%s'"), parts[1]);
	}
	double number = 0;
	try
	{
		number = boost::lexical_cast< double >(parts[0]);
	}
	catch (boost::bad_lexical_cast&)
	{
		fatal2(__("unable to convert '%s' to a number"), parts[0]);
	}
	auto result = number * unitIt->second;
	// 2^64 is the first value not representable in uint64_t
	if (!std::isfinite(result) || result < 0 || result >= 18446744073709551616.0)
	{
		fatal2(__("invalid size '%s'"), input);
	}
	return uint64_t(result);
}

} // namespace
} // namespace
