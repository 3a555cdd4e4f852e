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
#include <libintl.h>
#include <unistd.h>

#include <cstdio>

#include <abstractor/common.hpp>

namespace abstractor {

#define QUOTED(x) QUOTED_(x)
#define QUOTED_(x) # x
const char* const libraryVersion = QUOTED(ABSTRACTOR_VERSION);
#undef QUOTED
#undef QUOTED_

int messageFd = -1;

void __mwrite_line(const char* prefix, const string& message)
{
	if (messageFd != -1)
	{
		auto output = string(prefix) + message + "\n";
		if (write(messageFd, output.c_str(), output.size()) == -1)
		{
			// nowhere to report it
		}
	}
}

string join(const string& joiner, const vector< string >& parts)
{
	if (parts.empty())
	{
		return "";
	}
	string result = parts[0];
	auto size = parts.size();
	for (size_t i = 1; i < size; ++i)
	{
		result += joiner;
		result += parts[i];
	}
	return result;
}

string humanReadableSizeString(uint64_t bytes)
{
	char buf[32];
	if (bytes < 10*1000)
	{
		snprintf(buf, sizeof(buf), "%uB", (unsigned int)bytes);
	}
	else if (bytes < 100*1024)
	{
		snprintf(buf, sizeof(buf), "%.1fKiB", float(bytes) / 1024);
	}
	else if (bytes < 10*1000*1024)
	{
		snprintf(buf, sizeof(buf), "%.0fKiB", float(bytes) / 1024);
	}
	else if (bytes < 100*1024*1024)
	{
		snprintf(buf, sizeof(buf), "%.1fMiB", float(bytes) / 1024 / 1024);
	}
	else if (bytes < 10UL*1000*1024*1024)
	{
		snprintf(buf, sizeof(buf), "%.0fMiB", float(bytes) / 1024 / 1024);
	}
	else
	{
		snprintf(buf, sizeof(buf), "%.1fGiB", float(bytes) / 1024 / 1024 / 1024);
	}

	return string(buf);
}

const char* __(const char* buf)
{
	return dgettext("dependency-abstractor", buf);
}

} // namespace
