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
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <abstractor/file.hpp>

#include "helpers.hpp"

namespace abstractor {
namespace tests {

PackageDetails makeDetails(uint64_t installedBytes,
		const vector< string >& mandatory, const vector< string >& advised)
{
	PackageDetails result;
	result.installedBytes = installedBytes;
	result.relations[RT::Requires] = mandatory;
	result.relations[RT::Advises] = advised;
	return result;
}

double getConnectedInstalledBytes(const PackageCollection& collection)
{
	double result = 0;
	for (const string& identifier: collection.getIdentifiers())
	{
		const auto& details = collection.get(identifier);
		if (collection.isUpper(identifier) || details.claimantCount)
		{
			result += details.installedBytes;
		}
	}
	return result;
}

double getUpperAttributedBytes(const PackageCollection& collection)
{
	double result = 0;
	for (const string& identifier: collection.getIdentifiers(Tier::Upper))
	{
		result += collection.get(identifier).getTotalAttributedBytes();
	}
	return result;
}

namespace {

// no symbolic links are followed; returns false on the first failure
bool removeTree(const string& path)
{
	struct stat s;
	if (lstat(path.c_str(), &s) == -1)
	{
		return false;
	}
	if (!S_ISDIR(s.st_mode))
	{
		return unlink(path.c_str()) == 0;
	}

	DIR* directory = opendir(path.c_str());
	if (!directory)
	{
		return false;
	}
	vector< string > children;
	while (auto entry = readdir(directory))
	{
		if (strcmp(entry->d_name, ".") && strcmp(entry->d_name, ".."))
		{
			children.push_back(path + '/' + entry->d_name);
		}
	}
	closedir(directory);

	for (const string& child: children)
	{
		if (!removeTree(child))
		{
			return false;
		}
	}
	return rmdir(path.c_str()) == 0;
}

}

TemporaryDirectory::TemporaryDirectory()
{
	const char* base = getenv("TMPDIR");
	string pattern = string(base ? base : "/tmp") + "/abstractor-tests.XXXXXX";
	vector< char > buffer(pattern.begin(), pattern.end());
	buffer.push_back('\0');
	if (!mkdtemp(buffer.data()))
	{
		fatal2e("unable to create a temporary directory");
	}
	__path = buffer.data();
}

TemporaryDirectory::~TemporaryDirectory()
{
	if (!removeTree(__path))
	{
		warn2e("unable to remove the temporary directory '%s'", __path);
	}
}

const string& TemporaryDirectory::getPath() const
{
	return __path;
}

string TemporaryDirectory::writeFile(const string& relativePath, const string& content) const
{
	auto path = __path + '/' + relativePath;
	for (size_t position = path.find('/', __path.size() + 1); position != string::npos;
			position = path.find('/', position + 1))
	{
		auto directory = path.substr(0, position);
		if (mkdir(directory.c_str(), 0755) == -1 && errno != EEXIST)
		{
			fatal2e("unable to create the directory '%s'", directory);
		}
	}
	RequiredFile file(path, "w");
	file.put(content);
	return path;
}

}
}
