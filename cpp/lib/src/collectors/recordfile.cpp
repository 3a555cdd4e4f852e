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
#include <common/common.hpp>

#include <abstractor/collector.hpp>
#include <abstractor/file.hpp>
#include <abstractor/packagecollection.hpp>

#include <internal/common.hpp>
#include <internal/tagparser.hpp>

namespace abstractor {
namespace collectors {

namespace {

typedef PackageDetails::RelationTypes RT;
typedef internal::TagParser::StringRange StringRange;

void parseRelationList(const StringRange& value, vector< string >* result)
{
	auto elements = internal::split(',', value.toString());
	FORIT(elementIt, elements)
	{
		auto identifier = internal::trim(*elementIt);
		if (!identifier.empty())
		{
			result->push_back(identifier);
		}
	}
}

// unknown fields are ignored
void parseRelationField(const StringRange& tagName, const StringRange& tagValue,
		PackageDetails* details)
{
	for (size_t i = 0; i < RT::Count; ++i)
	{
		const string& relationName = RT::strings[i];
		if (tagName.equal(relationName.c_str(), relationName.size()))
		{
			parseRelationList(tagValue, &details->relations[i]);
			return;
		}
	}
}

PackageCollection::Tier parseTier(const string& input)
{
	if (input == PackageCollection::tierStrings[int(PackageCollection::Tier::Upper)])
	{
		return PackageCollection::Tier::Upper;
	}
	else if (input == PackageCollection::tierStrings[int(PackageCollection::Tier::Lower)])
	{
		return PackageCollection::Tier::Lower;
	}
	else
	{
		fatal2(__("wrong tier '%s'"), input);
		__builtin_unreachable();
	}
}

}

RecordFileCollector::RecordFileCollector(const string& path)
	: __path(path)
{
	if (__path.empty())
	{
		fatal2(__("the path to the record file is not specified"));
	}
}

void RecordFileCollector::collect(PackageCollection& collection)
{
	try
	{
		RequiredFile file(__path, "r");
		internal::TagParser parser(&file);
		StringRange tagName;
		StringRange tagValue;

		while (!file.eof())
		{
			string identifier;
			string tier;
			PackageDetails details;
			bool somethingParsed = false;

			while (parser.parseNextLine(tagName, tagValue))
			{
				somethingParsed = true;

#define TAG(str, code) if (tagName.equal(BUFFER_AND_SIZE(str))) { code; } else
				TAG("Package", identifier = tagValue.toString())
				TAG("Tier", tier = tagValue.toString())
				TAG("Name", details.name = tagValue.toString())
				TAG("Description", details.description = tagValue.toString())
				TAG("Category", details.category = tagValue.toString())
				TAG("Variety", details.variety = tagValue.toString())
				TAG("Installation", details.installation = tagValue.toString())
				TAG("Installed-Size", details.installedBytes = internal::humanToBytes(tagValue.toString()))
				{
					parseRelationField(tagName, tagValue, &details);
				}
#undef TAG
			}

			if (!somethingParsed)
			{
				continue;
			}

			if (identifier.empty())
			{
				fatal2(__("no '%s' field in the record"), "Package");
			}
			if (tier.empty())
			{
				fatal2(__("no '%s' field in the record of the package '%s'"), "Tier", identifier);
			}
			if (details.name.empty())
			{
				details.name = identifier.substr(0, identifier.find(':'));
			}
			collection.put(parseTier(tier), identifier, details);
		}
	}
	catch (Exception&)
	{
		fatal2(__("unable to parse the record file '%s'"), __path);
	}
}

analysis::PostProcessing::Type RecordFileCollector::getDefaultPostProcessing() const
{
	return analysis::PostProcessing::Promote;
}

}
}
