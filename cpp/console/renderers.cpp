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
#include <cmath>
#include <cstdio>
#include <ostream>

#include <abstractor/graph.hpp>

#include "renderers.hpp"

namespace {

const char* const topColor = "#a06a20";
const char* const topFillColor = "#e3c89c";
const char* const requiresColor = "#2080a0";
const char* const requiresEdgeColor = "#2080a080";
const char* const advisesColor = "#3c9a62";
const char* const advisesFillColor = "#b8dcc6";

string quote(const string& input)
{
	string result = "\"";
	for (char c: input)
	{
		if (c == '"')
		{
			result += '\\';
		}
		result += c;
	}
	result += '"';
	return result;
}

string formatAttributes(const DotGraph::Attributes& attributes)
{
	vector< string > parts;
	for (const auto& attribute: attributes)
	{
		parts.push_back(attribute.first + '=' + quote(attribute.second));
	}
	return join(",", parts);
}

string formatNumber(double value)
{
	return format2("%.2f", value);
}

// linear interpolation of '#rrggbb' colors, the alpha channel of the first one is kept
string mixColors(const string& first, const string& second, double t)
{
	unsigned int firstRgb[3];
	unsigned int secondRgb[3];
	if (sscanf(first.c_str(), "#%02x%02x%02x", &firstRgb[0], &firstRgb[1], &firstRgb[2]) != 3 ||
			sscanf(second.c_str(), "#%02x%02x%02x", &secondRgb[0], &secondRgb[1], &secondRgb[2]) != 3)
	{
		fatal2i("wrong color specification");
	}

	string result = "#";
	for (size_t i = 0; i < 3; ++i)
	{
		auto component = (unsigned int)std::lround(firstRgb[i] + (double(secondRgb[i]) - firstRgb[i]) * t);
		result += format2("%02x", component);
	}
	result += first.substr(std::min(first.size(), size_t(7)));
	return result;
}

// splits to lines of 'width' characters
string wrapLabel(const string& input, size_t width)
{
	vector< string > lines;
	for (size_t position = 0; position < input.size(); position += width)
	{
		lines.push_back(input.substr(position, width));
	}
	return join("\\n", lines);
}

struct Group
{
	uint64_t size;
	vector< string > members;

	Group()
		: size(0)
	{}
};

}

void DotGraph::addNode(const string& identifier, const Attributes& attributes)
{
	__nodes.push_back(quote(identifier) + " [" + formatAttributes(attributes) + "]");
}

void DotGraph::addEdge(const string& from, const string& to, const Attributes& attributes)
{
	__edges.push_back(quote(from) + " -> " + quote(to) + " [" + formatAttributes(attributes) + "]");
}

void DotGraph::print(std::ostream& output) const
{
	static const vector< string > options = {
		"overlap=prism",
		"overlap_scaling=-6",
		"smoothing=rng",
		"splines=true",
		"esep=\"+10\"",
		"start=1",
		"tooltip=\" \"",
		"node [fontname=Cantarell]",
	};

	auto nodes = __nodes;
	std::sort(nodes.begin(), nodes.end());
	auto edges = __edges;
	std::sort(edges.begin(), edges.end());

	output << "digraph D {\n\n";
	for (const string& option: options)
	{
		output << "  " << option << '\n';
	}
	output << "  \n";
	for (const string& node: nodes)
	{
		output << "  " << node << '\n';
	}
	output << "  \n";
	for (const string& edge: edges)
	{
		output << "  " << edge << '\n';
	}
	output << "\n}\n";
}

void renderDotGraph(const PackageCollection& collection, size_t cutOff, std::ostream& output)
{
	DotGraph graph;
	set< string > allowedUpper;

	auto upperIdentifiers = collection.getIdentifiers(Tier::Upper);

	// lower-tier packages grouped by the set of their mandatory upper-tier claimants
	map< vector< string >, Group > lowerGroups;
	for (const string& identifier: collection.getIdentifiers(Tier::Lower))
	{
		const auto& details = collection.get(identifier);
		vector< string > claimants;
		for (const string& dependent: details.recursiveWhatRequires)
		{
			if (collection.isUpper(dependent))
			{
				claimants.push_back(dependent);
			}
		}
		auto& group = lowerGroups[claimants];
		group.size += details.installedBytes;
		group.members.push_back(identifier);
	}
	auto isShownGroup = [cutOff](const vector< string >& claimants)
	{
		return !claimants.empty() && claimants.size() >= cutOff;
	};

	double minLowerGroupSize = 0;
	double maxLowerGroupSize = 0;
	{
		bool first = true;
		for (const auto& group: lowerGroups)
		{
			if (!isShownGroup(group.first))
			{
				continue;
			}
			double size = group.second.size;
			if (first || size < minLowerGroupSize) minLowerGroupSize = size;
			if (first || size > maxLowerGroupSize) maxLowerGroupSize = size;
			first = false;
		}
	}

	double minUpperSize = 0;
	double maxUpperSize = 0;
	double maxOptionalRatio = 0;
	for (size_t i = 0; i < upperIdentifiers.size(); ++i)
	{
		const auto& details = collection.get(upperIdentifiers[i]);
		auto size = details.getTotalAttributedBytes();
		if (i == 0 || size < minUpperSize) minUpperSize = size;
		if (i == 0 || size > maxUpperSize) maxUpperSize = size;

		PackageDetails::CostRatios ratios;
		if (details.getCostRatios(&ratios) && ratios.optional > maxOptionalRatio)
		{
			maxOptionalRatio = ratios.optional;
		}
	}

	// relations inside the upper tier
	map< string, set< string > > upperAdvisers;
	for (const string& identifier: upperIdentifiers)
	{
		const auto& details = collection.get(identifier);

		set< string > requirements(details.relations[RT::Requires].begin(), details.relations[RT::Requires].end());
		for (const string& requirement: requirements)
		{
			if (collection.isUpper(requirement))
			{
				graph.addEdge(identifier, requirement, {
						{ "penwidth", "4" }, { "color", topColor } });
				allowedUpper.insert(identifier);
				allowedUpper.insert(requirement);
			}
		}

		set< string > advices(details.relations[RT::Advises].begin(), details.relations[RT::Advises].end());
		for (const string& advice: advices)
		{
			if (collection.isUpper(advice))
			{
				graph.addEdge(identifier, advice, {
						{ "style", "dashed" }, { "penwidth", "4" }, { "color", advisesColor } });
				allowedUpper.insert(identifier);
				allowedUpper.insert(advice);
			}
			else if (collection.contains(advice))
			{
				upperAdvisers[advice].insert(identifier);
			}
		}
	}

	// advised lower-tier packages grouped by the set of their upper-tier advisers
	map< vector< string >, Group > adviceGroups;
	for (const auto& adviceEntry: upperAdvisers)
	{
		vector< string > advisers(adviceEntry.second.begin(), adviceEntry.second.end());
		auto& group = adviceGroups[advisers];
		group.size += collection.get(adviceEntry.first).installedBytes;
		group.members.push_back(adviceEntry.first);
	}

	size_t groupNumber = 0;
	for (const auto& group: lowerGroups)
	{
		if (!isShownGroup(group.first))
		{
			continue;
		}
		auto groupId = format2("#%zu", groupNumber++);
		auto height = minMaxNormalize(group.second.size, minLowerGroupSize, maxLowerGroupSize, 0.2, 2);
		graph.addNode(groupId, {
				{ "shape", "point" }, { "height", formatNumber(height) }, { "fixedsize", "true" },
				{ "color", requiresColor }, { "tooltip", join("\\n", group.second.members) } });
		for (const string& claimant: group.first)
		{
			graph.addEdge(claimant, groupId, {
					{ "arrowhead", "none" }, { "color", requiresEdgeColor }, { "penwidth", "1.5" } });
			allowedUpper.insert(claimant);
		}
	}

	groupNumber = 0;
	for (const auto& group: adviceGroups)
	{
		auto groupId = format2("#R%zu", groupNumber++);
		set< string > names;
		for (const string& member: group.second.members)
		{
			names.insert(collection.get(member).name);
		}
		auto label = join("\\l", vector< string >(names.begin(), names.end())) + "\\l";
		graph.addNode(groupId, {
				{ "label", label }, { "tooltip", join("\\n", group.second.members) },
				{ "shape", "box" }, { "fixedsize", "false" }, { "style", "rounded,filled" },
				{ "penwidth", "2" }, { "color", advisesColor }, { "fillcolor", advisesFillColor },
				{ "labeljust", "l" } });
		for (const string& adviser: group.first)
		{
			graph.addEdge(adviser, groupId, {
					{ "style", "dashed" }, { "penwidth", "2" }, { "arrowhead", "none" },
					{ "color", advisesColor } });
			allowedUpper.insert(adviser);
		}
	}

	for (const string& identifier: allowedUpper)
	{
		const auto& details = collection.get(identifier);

		double t = 0;
		PackageDetails::CostRatios ratios;
		if (details.getCostRatios(&ratios) && ratios.optional > 0)
		{
			t = minMaxNormalize(ratios.optional, 0, maxOptionalRatio);
		}
		auto height = minMaxNormalize(details.getTotalAttributedBytes(), minUpperSize, maxUpperSize, 1.2, 3);

		graph.addNode(identifier, {
				{ "label", wrapLabel(details.name.substr(0, 40), 10) },
				{ "shape", "circle" }, { "penwidth", "4" },
				{ "height", formatNumber(height) }, { "fixedsize", "true" },
				{ "color", mixColors(topColor, advisesColor, t) },
				{ "fillcolor", mixColors(topFillColor, advisesFillColor, t) },
				{ "style", "filled" } });
	}

	graph.print(output);
}

vector< string > renderBarGraph(const PackageCollection& collection, size_t width)
{
	vector< string > lines = {
		__("# size of the explicitly user-installed package"),
		__("= sum of size per share count over all implicit recursive requirements"),
		__("- sum of size per share count over all other implicit recursive requirements and recommendations"),
		"",
	};

	auto identifiers = collection.getIdentifiers(Tier::Upper);
	if (identifiers.empty())
	{
		return lines;
	}
	std::stable_sort(identifiers.begin(), identifiers.end(),
			[&collection](const string& left, const string& right)
			{
				return collection.get(left).getTotalAttributedBytes() >
						collection.get(right).getTotalAttributedBytes();
			});

	double maximum = collection.get(identifiers.front()).getTotalAttributedBytes();
	double minimum = collection.get(identifiers.back()).getTotalAttributedBytes();
	double lowerBound = (maximum > 0) ? std::round(minimum * width / maximum) : 0;

	for (const string& identifier: identifiers)
	{
		const auto& details = collection.get(identifier);
		auto size = minMaxNormalize(details.getTotalAttributedBytes(), minimum, maximum, lowerBound, width);

		long parts[3] = { 0, 0, 0 };
		string ratiosString;
		string notableAdvice;

		PackageDetails::CostRatios ratios;
		if (!details.getCostRatios(&ratios))
		{
			ratiosString = "NaN NaN NaN";
		}
		else
		{
			const double values[3] = { ratios.installed, ratios.mandatory, ratios.optional };
			long sum = 0;
			for (size_t i = 0; i < 3; ++i)
			{
				parts[i] = std::lround(size * values[i]);
				sum += parts[i];
			}
			// the dominant part absorbs rounding errors so the bar fills the size
			auto maxIndex = std::max_element(values, values + 3) - values;
			parts[maxIndex] = std::max(0L, parts[maxIndex] + std::lround(size) - sum);

			ratiosString = format2("%.1f %.1f %.1f", ratios.installed, ratios.mandatory, ratios.optional);

			if (ratios.optional > 0.33)
			{
				const PackageDetails* notableDetails = nullptr;
				double notableShare = 0;
				for (const string& advice: details.relations[RT::Advises])
				{
					const PackageDetails* adviceDetails = collection.find(advice);
					if (!adviceDetails || collection.isUpper(advice))
					{
						continue;
					}
					double share = adviceDetails->installedBytes;
					if (adviceDetails->claimantCount)
					{
						share /= adviceDetails->claimantCount;
					}
					if (!notableDetails || share > notableShare)
					{
						notableDetails = adviceDetails;
						notableShare = share;
					}
				}
				if (notableDetails)
				{
					notableAdvice = string(" -> ") + notableDetails->name;
					size_t lowerComplementCount = 0;
					for (const string& complement: details.recursiveComplements)
					{
						if (!collection.isUpper(complement))
						{
							++lowerComplementCount;
						}
					}
					if (lowerComplementCount > 1)
					{
						notableAdvice += "...";
					}
				}
			}
		}

		string bar = string(parts[0], '#') + string(parts[1], '=') + string(parts[2], '-');
		if (bar.size() < width)
		{
			bar.append(width - bar.size(), ' ');
		}

		lines.push_back(format2("%9s %s [%s] %s%s",
				humanReadableSizeString(uint64_t(details.getTotalAttributedBytes())),
				ratiosString, bar, details.name, notableAdvice));
	}

	return lines;
}

vector< string > renderDetails(const PackageCollection& collection, const string& identifier, size_t width)
{
	graph::NeighboursFunction< string > getNeighbours = [&collection](const string& vertex) -> vector< string >
	{
		auto result = getPresentRelations(collection, vertex, RT::Requires);
		auto advises = getPresentRelations(collection, vertex, RT::Advises);
		result.insert(result.end(), advises.begin(), advises.end());
		return result;
	};
	auto distances = graph::getDistancesFrom(identifier, getNeighbours);

	size_t maxNameLength = 0;
	uint64_t maxInstalledBytes = 0;
	for (const auto& entry: distances)
	{
		const auto& details = collection.get(entry.first);
		maxNameLength = std::max(maxNameLength, details.name.size());
		maxInstalledBytes = std::max(maxInstalledBytes, details.installedBytes);
	}

	const auto& rootDetails = collection.get(identifier);

	vector< string > lines;
	size_t previousLevel = 0;
	for (const auto& entry: distances)
	{
		if (entry.second != previousLevel)
		{
			lines.push_back("");
			previousLevel = entry.second;
		}

		const auto& details = collection.get(entry.first);
		auto filled = (size_t)std::lround(minMaxNormalize(details.installedBytes, 0, maxInstalledBytes, 0, width));
		string bar = string(width - filled, '.') + string(filled, '#');

		string name = details.name;
		name.append(maxNameLength - name.size(), ' ');

		const char* relation;
		if (entry.first == identifier)
		{
			relation = __(PackageCollection::tierStrings[int(collection.getTier(identifier))]);
		}
		else if (rootDetails.recursiveRequires.count(entry.first))
		{
			relation = __("required");
		}
		else
		{
			relation = __("complement");
		}

		lines.push_back(format2("%2zu %s [%s] %9s %s", entry.second, name, bar,
				humanReadableSizeString(details.installedBytes), relation));
	}

	return lines;
}

vector< string > renderPackageList(const PackageCollection& collection, const Tier* tier)
{
	vector< string > lines;

	auto identifiers = tier ? collection.getIdentifiers(*tier) : collection.getIdentifiers();
	for (const string& identifier: identifiers)
	{
		const auto& details = collection.get(identifier);
		auto packageTier = collection.getTier(identifier);

		string attributed;
		if (packageTier == Tier::Upper)
		{
			attributed = humanReadableSizeString(uint64_t(details.getTotalAttributedBytes()));
		}
		else
		{
			attributed = format2(__("%zu claimants"), details.claimantCount);
		}
		lines.push_back(format2("%s %s %s %s", identifier,
				PackageCollection::tierStrings[int(packageTier)],
				humanReadableSizeString(details.installedBytes), attributed));
	}

	return lines;
}

vector< string > renderConfig(const Config& config)
{
	vector< string > lines;

	for (const string& name: config.getScalarOptionNames())
	{
		auto value = config.getString(name);
		if (!value.empty())
		{
			lines.push_back(format2("%s \"%s\";", name, value));
		}
	}
	for (const string& name: config.getListOptionNames())
	{
		lines.push_back(format2("%s {};", name));
		for (const string& value: config.getList(name))
		{
			lines.push_back(format2("%s { \"%s\"; };", name, value));
		}
	}

	return lines;
}
