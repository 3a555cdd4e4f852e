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
#include <algorithm>
#include <limits>
#include <map>
using std::map;

#include <common/common.hpp>
#include <common/regex.hpp>

#include <abstractor/collector.hpp>
#include <abstractor/config.hpp>
#include <abstractor/file.hpp>
#include <abstractor/graph.hpp>
#include <abstractor/packagecollection.hpp>

#include <internal/common.hpp>
#include <internal/filesystem.hpp>
#include <internal/tagparser.hpp>

namespace abstractor {
namespace collectors {

namespace {

typedef PackageDetails::RelationTypes RT;
typedef internal::TagParser::StringRange StringRange;

/*
 Only a subset of dpkg status fields is interesting here. Relation fields are
 kept unparsed until the set of installed packages is known.
*/
struct StatusRecord
{
	string name;
	string architecture;
	string priority;
	string section;
	string description;
	uint64_t installedBytes;
	string depends;
	string preDepends;
	string recommends;
	string suggests;
	string enhances;
	string provides;
	bool automaticallyInstalled;

	StatusRecord()
		: installedBytes(0), automaticallyInstalled(false)
	{}
};

uint64_t parseKibibytes(const StringRange& value)
{
	auto source = value.toString();
	auto kibibytes = internal::string2uint64(std::make_pair(source.cbegin(), source.cend()));
	if (kibibytes > std::numeric_limits< uint64_t >::max() / 1024)
	{
		fatal2(__("too big installed size '%s'"), source);
	}
	return kibibytes * 1024;
}

bool isInstalledStatus(const string& status, const string& packageName)
{
	auto parts = internal::split(' ', status);
	if (parts.size() != 3)
	{
		fatal2(__("malformed status '%s' (for the package '%s')"), status, packageName);
	}
	return parts[2] == "installed";
}

bool isInSections(const string& section, const vector< string >& sections)
{
	FORIT(sectionIt, sections)
	{
		if (section == *sectionIt)
		{
			return true;
		}
		// non-main components, e.g. 'contrib/libs'
		auto suffix = string("/") + *sectionIt;
		if (section.size() > suffix.size() &&
				section.compare(section.size() - suffix.size(), suffix.size(), suffix) == 0)
		{
			return true;
		}
	}
	return false;
}

class StatusIndex
{
	map< string, StatusRecord > __records; // by identifier
	map< string, vector< string > > __identifiers_by_name;
	map< string, vector< string > > __providers_by_name;
	string __native_architecture;

	void __add_candidates(const vector< string >& identifiers,
			const string& preferredArchitecture, vector< string >* result) const;
	vector< string > __get_candidates(const string& alternative, const string& dependentArchitecture) const;
 public:
	void parseStatusFile(const string& path);
	void parseExtendedStatesFile(const string& path);
	void index();

	const map< string, StatusRecord >& getRecords() const
	{
		return __records;
	}
	const string& getNativeArchitecture() const
	{
		return __native_architecture;
	}
	string getIdentifier(const string& name, const string& architecture) const;
	vector< string > resolve(const string& relationField, const string& dependentArchitecture,
			const set< string >* allowed) const;
};

string StatusIndex::getIdentifier(const string& name, const string& architecture) const
{
	if (architecture.empty() || architecture == "all")
	{
		return name + ':' + __native_architecture;
	}
	return name + ':' + architecture;
}

void StatusIndex::parseStatusFile(const string& path)
{
	string openError;
	File file(path, "r", openError);
	if (!openError.empty())
	{
		fatal2(__("unable to open the dpkg status file '%s': %s"), path, openError);
	}

	internal::TagParser parser(&file);
	StringRange tagName;
	StringRange tagValue;

	vector< pair< string, StatusRecord > > installedRecords;
	map< string, size_t > architectureCounts;

	while (!file.eof())
	{
		StatusRecord record;
		string status;
		while (parser.parseNextLine(tagName, tagValue))
		{
#define TAG(str, code) if (tagName.equal(BUFFER_AND_SIZE(str))) { code; } else
			TAG("Package", record.name = tagValue.toString())
			TAG("Status", status = tagValue.toString())
			TAG("Architecture", record.architecture = tagValue.toString())
			TAG("Priority", record.priority = tagValue.toString())
			TAG("Section", record.section = tagValue.toString())
			TAG("Description", record.description = tagValue.toString())
			TAG("Installed-Size", record.installedBytes = parseKibibytes(tagValue))
			TAG("Depends", record.depends = tagValue.toString())
			TAG("Pre-Depends", record.preDepends = tagValue.toString())
			TAG("Recommends", record.recommends = tagValue.toString())
			TAG("Suggests", record.suggests = tagValue.toString())
			TAG("Enhances", record.enhances = tagValue.toString())
			TAG("Provides", record.provides = tagValue.toString())
			{}
#undef TAG
		}

		if (record.name.empty())
		{
			continue; // empty stanza
		}
		if (status.empty())
		{
			fatal2(__("no '%s' field in the record of the package '%s'"), "Status", record.name);
		}
		if (!isInstalledStatus(status, record.name))
		{
			continue;
		}
		if (!record.architecture.empty() && record.architecture != "all")
		{
			++architectureCounts[record.architecture];
		}
		installedRecords.push_back(std::make_pair(record.name, record));
	}

	// the architecture of dpkg itself, or the most widespread one
	FORIT(recordIt, installedRecords)
	{
		if (recordIt->first == "dpkg" && recordIt->second.architecture != "all")
		{
			__native_architecture = recordIt->second.architecture;
		}
	}
	if (__native_architecture.empty())
	{
		size_t maxCount = 0;
		FORIT(countIt, architectureCounts)
		{
			if (countIt->second > maxCount)
			{
				maxCount = countIt->second;
				__native_architecture = countIt->first;
			}
		}
	}
	if (__native_architecture.empty())
	{
		__native_architecture = "all";
	}

	FORIT(recordIt, installedRecords)
	{
		auto identifier = getIdentifier(recordIt->second.name, recordIt->second.architecture);
		__records[identifier] = recordIt->second;
	}
}

void StatusIndex::parseExtendedStatesFile(const string& path)
{
	string openError;
	File file(path, "r", openError);
	if (!openError.empty())
	{
		warn2(__("unable to open the extended states file '%s': %s"), path, openError);
		return;
	}

	internal::TagParser parser(&file);
	StringRange tagName;
	StringRange tagValue;

	while (!file.eof())
	{
		string packageName;
		string architecture;
		bool automaticallyInstalled = false;
		while (parser.parseNextLine(tagName, tagValue))
		{
			if (tagName.equal(BUFFER_AND_SIZE("Package")))
			{
				packageName = tagValue.toString();
			}
			else if (tagName.equal(BUFFER_AND_SIZE("Architecture")))
			{
				architecture = tagValue.toString();
			}
			else if (tagName.equal(BUFFER_AND_SIZE("Auto-Installed")))
			{
				if (tagValue.equal(BUFFER_AND_SIZE("1")))
				{
					automaticallyInstalled = true;
				}
				else if (!tagValue.equal(BUFFER_AND_SIZE("0")))
				{
					fatal2(__("bad value '%s' (should be 0 or 1) for the package '%s'"),
							tagValue.toString(), packageName);
				}
			}
		}

		if (packageName.empty() || !automaticallyInstalled)
		{
			continue;
		}
		auto recordIt = __records.find(getIdentifier(packageName, architecture));
		if (recordIt != __records.end())
		{
			recordIt->second.automaticallyInstalled = true;
		}
	}
}

void StatusIndex::index()
{
	static const sregex providedNameRegex = sregex::compile("^\\s*([^\\s:(]+)");

	FORIT(recordIt, __records)
	{
		const string& identifier = recordIt->first;
		__identifiers_by_name[recordIt->second.name].push_back(identifier);

		auto providedNames = internal::split(',', recordIt->second.provides);
		FORIT(providedNameIt, providedNames)
		{
			smatch m;
			if (regex_search(*providedNameIt, m, providedNameRegex))
			{
				__providers_by_name[m[1].str()].push_back(identifier);
			}
		}
	}
}

void StatusIndex::__add_candidates(const vector< string >& identifiers,
		const string& preferredArchitecture, vector< string >* result) const
{
	// the one of the preferred architecture goes first
	FORIT(identifierIt, identifiers)
	{
		if (__records.find(*identifierIt)->second.architecture == preferredArchitecture)
		{
			result->push_back(*identifierIt);
		}
	}
	FORIT(identifierIt, identifiers)
	{
		if (__records.find(*identifierIt)->second.architecture != preferredArchitecture)
		{
			result->push_back(*identifierIt);
		}
	}
}

vector< string > StatusIndex::__get_candidates(const string& alternative,
		const string& dependentArchitecture) const
{
	static const sregex alternativeRegex = sregex::compile(
			"^\\s*([^\\s:(\\[]+)(?::([^\\s(\\[]+))?");

	vector< string > result;

	smatch m;
	if (!regex_search(alternative, m, alternativeRegex))
	{
		fatal2(__("unable to parse the relation '%s'"), alternative);
	}
	string name = m[1].str();
	string qualifier = m[2].str();

	if (!qualifier.empty() && qualifier != "any" && qualifier != "native")
	{
		auto identifier = getIdentifier(name, qualifier);
		if (__records.count(identifier))
		{
			result.push_back(identifier);
		}
		return result;
	}

	const string& preferredArchitecture = (dependentArchitecture == "all" || qualifier == "native") ?
			__native_architecture : dependentArchitecture;

	auto realIt = __identifiers_by_name.find(name);
	if (realIt != __identifiers_by_name.end())
	{
		__add_candidates(realIt->second, preferredArchitecture, &result);
	}
	auto providerIt = __providers_by_name.find(name);
	if (providerIt != __providers_by_name.end())
	{
		__add_candidates(providerIt->second, preferredArchitecture, &result);
	}

	return result;
}

vector< string > StatusIndex::resolve(const string& relationField,
		const string& dependentArchitecture, const set< string >* allowed) const
{
	vector< string > result;

	auto groups = internal::split(',', relationField);
	FORIT(groupIt, groups)
	{
		auto alternatives = internal::split('|', *groupIt);
		bool satisfied = false;
		FORIT(alternativeIt, alternatives)
		{
			auto candidates = __get_candidates(*alternativeIt, dependentArchitecture);
			FORIT(candidateIt, candidates)
			{
				if (!allowed || allowed->count(*candidateIt))
				{
					result.push_back(*candidateIt);
					satisfied = true;
					break;
				}
			}
			if (satisfied)
			{
				break;
			}
		}
	}

	return result;
}

/*
 APT history log: packages installed or removed on user's request, and
 packages installed with no 'Requested-By' field (by the OS installer or
 unattended tools). Identifiers are normalized through the status index.
*/
struct History
{
	set< string > manual;
	set< string > automatic;
	set< string > os;

	void parseFile(const string& path, const StatusIndex&);
};

void History::parseFile(const string& path, const StatusIndex& statusIndex)
{
	static const sregex entryRegex = sregex::compile("\\s*([^:]*):([^ ]*) \\(([^\\)]*)\\),? ?");

	string openError;
	File file(path, "r", openError);
	if (!openError.empty())
	{
		fatal2(__("unable to open the APT history file '%s': %s"), path, openError);
	}

	internal::TagParser parser(&file);
	StringRange tagName;
	StringRange tagValue;

	while (!file.eof())
	{
		bool requestedByUser = false;
		vector< pair< bool, string > > operations; // (is install, entries)
		while (parser.parseNextLine(tagName, tagValue))
		{
			if (tagName.equal(BUFFER_AND_SIZE("Requested-By")))
			{
				requestedByUser = true;
			}
			else if (tagName.equal(BUFFER_AND_SIZE("Install")))
			{
				operations.push_back(std::make_pair(true, tagValue.toString()));
			}
			else if (tagName.equal(BUFFER_AND_SIZE("Remove")) || tagName.equal(BUFFER_AND_SIZE("Purge")))
			{
				operations.push_back(std::make_pair(false, tagValue.toString()));
			}
		}

		FORIT(operationIt, operations)
		{
			bool isInstall = operationIt->first;
			const string& entries = operationIt->second;

			auto position = entries.cbegin();
			smatch m;
			while (regex_search(position, entries.cend(), m, entryRegex))
			{
				auto identifier = statusIndex.getIdentifier(m[1].str(), m[2].str());
				const string details = m[3].str();
				const string automaticSuffix = "automatic";
				bool isAutomatic = details.size() >= automaticSuffix.size() &&
						details.compare(details.size() - automaticSuffix.size(),
						automaticSuffix.size(), automaticSuffix) == 0;

				if (!requestedByUser)
				{
					os.insert(identifier);
				}
				else if (isInstall)
				{
					(isAutomatic ? automatic : manual).insert(identifier);
				}
				else
				{
					(isAutomatic ? automatic : manual).erase(identifier);
				}

				position = m[0].second;
			}
		}
	}
}

void fillRelations(const StatusIndex& statusIndex, const StatusRecord& record,
		const set< string >* allowed, PackageDetails* details)
{
	auto resolve = [&statusIndex, &record, allowed](const string& field)
	{
		return statusIndex.resolve(field, record.architecture, allowed);
	};

	auto& mandatory = details->relations[RT::Requires];
	mandatory = resolve(record.depends);
	auto preDepends = resolve(record.preDepends);
	mandatory.insert(mandatory.end(), preDepends.begin(), preDepends.end());

	details->relations[RT::Advises] = resolve(record.recommends);
	details->relations[RT::Suggests] = resolve(record.suggests);
	details->relations[RT::Enhances] = resolve(record.enhances);
}

}

DpkgCollector::DpkgCollector(const Config& config)
	: __status_path(config.getPath("dir::state::status")),
	__extended_states_path(config.getPath("dir::state::extendedstates")),
	__history_path(config.getPath("dir::log::history")),
	__system_priorities(config.getList("abstractor::dpkg::system-priorities")),
	__system_sections(config.getList("abstractor::dpkg::system-sections")),
	__support_sections(config.getList("abstractor::dpkg::support-sections")),
	__debugging(config.getBool("debug::collector"))
{}

void DpkgCollector::collect(PackageCollection& collection)
{
	StatusIndex statusIndex;
	try
	{
		statusIndex.parseStatusFile(__status_path);
		statusIndex.parseExtendedStatesFile(__extended_states_path);
		statusIndex.index();
	}
	catch (Exception&)
	{
		fatal2(__("unable to read the dpkg database"));
	}

	const auto& records = statusIndex.getRecords();
	if (__debugging)
	{
		debug2("dpkg collector: %zu installed packages, native architecture '%s'",
				records.size(), statusIndex.getNativeArchitecture());
	}

	History history;
	try
	{
		// rotated logs first, from the oldest
		vector< pair< time_t, string > > historyFiles;
		auto historyFileName = internal::fs::filename(__history_path);
		auto stem = historyFileName.substr(0, historyFileName.rfind('.'));
		auto paths = internal::fs::glob(internal::fs::dirname(__history_path) + '/' + stem + '*');
		FORIT(pathIt, paths)
		{
			if (!internal::fs::fileExists(*pathIt))
			{
				continue;
			}
			if (pathIt->size() > 3 && pathIt->compare(pathIt->size() - 3, 3, ".gz") == 0)
			{
				if (__debugging)
				{
					debug2("dpkg collector: skipping the compressed history file '%s'", *pathIt);
				}
				continue;
			}
			historyFiles.push_back(std::make_pair(internal::fs::fileModificationTime(*pathIt), *pathIt));
		}
		// the same modification time: 'history.log.2' is older than 'history.log.1'
		std::sort(historyFiles.begin(), historyFiles.end(),
				[](const pair< time_t, string >& left, const pair< time_t, string >& right)
				{
					return left.first < right.first || (left.first == right.first && left.second > right.second);
				});
		FORIT(historyFileIt, historyFiles)
		{
			history.parseFile(historyFileIt->second, statusIndex);
		}
	}
	catch (Exception&)
	{
		fatal2(__("unable to read the APT history log"));
	}
	if (__debugging)
	{
		debug2("dpkg collector: history: %zu manual, %zu automatic, %zu installed without a requester",
				history.manual.size(), history.automatic.size(), history.os.size());
	}

	graph::NeighboursFunction< string > getDependencies = [&statusIndex, &records](const string& identifier) -> vector< string >
	{
		PackageDetails details;
		fillRelations(statusIndex, records.find(identifier)->second, NULL, &details);
		auto result = details.relations[RT::Requires];
		result.insert(result.end(), details.relations[RT::Advises].begin(), details.relations[RT::Advises].end());
		return result;
	};

	// packages brought by the base system, with everything they pull in
	set< string > systemIdentifiers;
	FORIT(recordIt, records)
	{
		const string& identifier = recordIt->first;
		const StatusRecord& record = recordIt->second;

		bool isSystemRoot = std::find(__system_priorities.begin(), __system_priorities.end(),
				record.priority) != __system_priorities.end() ||
				std::find(__system_sections.begin(), __system_sections.end(),
				record.section) != __system_sections.end();
		if (isSystemRoot && !systemIdentifiers.count(identifier))
		{
			auto reachable = graph::getReachableFrom(identifier, getDependencies);
			systemIdentifiers.insert(reachable.begin(), reachable.end());
		}
	}

	set< string > userIdentifiers;
	FORIT(recordIt, records)
	{
		if (!systemIdentifiers.count(recordIt->first) && !history.os.count(recordIt->first))
		{
			userIdentifiers.insert(recordIt->first);
		}
	}

	FORIT(identifierIt, userIdentifiers)
	{
		const StatusRecord& record = records.find(*identifierIt)->second;

		PackageDetails details;
		details.name = record.name;
		details.description = record.description;
		details.category = record.section;
		details.variety = record.architecture;
		details.installation = record.automaticallyInstalled ? "automatic" : "manual";
		details.installedBytes = record.installedBytes;
		fillRelations(statusIndex, record, &userIdentifiers, &details);

		bool isAhistoricalSupport = isInSections(record.section, __support_sections) &&
				!history.manual.count(*identifierIt);
		bool isUpper = !record.automaticallyInstalled && !isAhistoricalSupport &&
				!history.automatic.count(*identifierIt);
		collection.put(isUpper ? PackageCollection::Tier::Upper : PackageCollection::Tier::Lower,
				*identifierIt, details);
	}

	if (__debugging)
	{
		debug2("dpkg collector: %zu system packages, %zu user packages",
				systemIdentifiers.size(), userIdentifiers.size());
	}
}

analysis::PostProcessing::Type DpkgCollector::getDefaultPostProcessing() const
{
	return analysis::PostProcessing::Prune;
}

}
}
