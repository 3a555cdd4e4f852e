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
#include <ctime>

#include <common/common.hpp>

#include <abstractor/collector.hpp>
#include <abstractor/config.hpp>
#include <abstractor/packagecollection.hpp>

#include <internal/logger.hpp>

namespace abstractor {

using internal::Logger;

Collector::~Collector()
{}

unique_ptr< Collector > Collector::create(const Config& config)
{
	auto name = config.getString("abstractor::collector");
	if (name == "records")
	{
		return unique_ptr< Collector >(
				new collectors::RecordFileCollector(config.getPath("abstractor::records::path")));
	}
	else if (name == "dpkg")
	{
		return unique_ptr< Collector >(new collectors::DpkgCollector(config));
	}
	else
	{
		fatal2(__("unknown collector '%s'"), name);
		__builtin_unreachable();
	}
}

namespace {

struct timespec getCurrentTimeSpec()
{
	struct timespec currentTimeSpec;
	if (clock_gettime(CLOCK_MONOTONIC, &currentTimeSpec) == -1)
	{
		warn2e(__("%s() failed"), "clock_gettime");
		currentTimeSpec.tv_sec = time(NULL);
		currentTimeSpec.tv_nsec = 0;
	}
	return currentTimeSpec;
}

float getTimeSpecDiff(const timespec& oldValue, const timespec& newValue)
{
	float result = newValue.tv_sec - oldValue.tv_sec;
	result += float(newValue.tv_nsec - oldValue.tv_nsec) / (1000*1000*1000);
	return result;
}

// runs one stage, logging its duration
template < typename StageT >
void runStage(Logger& logger, Logger::Subsystem subsystem, bool debugging,
		const char* stageName, StageT stage)
{
	auto startTimeSpec = getCurrentTimeSpec();
	stage();
	auto duration = getTimeSpecDiff(startTimeSpec, getCurrentTimeSpec());

	auto message = format2("%s: done in %.3f s", stageName, duration);
	logger.log(subsystem, 2, message);
	if (debugging)
	{
		debug2("%s", message);
	}
}

analysis::PostProcessing::Type getPostProcessing(const Config& config, const Collector& collector)
{
	auto name = config.getString("abstractor::post-process");
	if (name == "auto")
	{
		return collector.getDefaultPostProcessing();
	}
	return analysis::PostProcessing::fromString(name);
}

}

shared_ptr< PackageCollection > manufacturePackageCollection(
		const Config& config, Collector& collector)
{
	typedef Logger::Subsystem Subsystem;

	Logger logger(config);
	const bool debugging = config.getBool("debug::analysis");

	auto postProcessing = getPostProcessing(config, collector);
	shared_ptr< PackageCollection > collection(new PackageCollection);

	try
	{
		runStage(logger, Subsystem::Collection, debugging, "collection", [&collector, &collection]()
		{
			collector.collect(*collection);
		});
		logger.log(Subsystem::Collection, 1, format2("collected %zu packages (%zu upper, %zu lower)",
				collection->size(), collection->getIdentifiers(PackageCollection::Tier::Upper).size(),
				collection->getIdentifiers(PackageCollection::Tier::Lower).size()));

		runStage(logger, Subsystem::Analysis, debugging, "closures", [&collection]()
		{
			analysis::computeRecursiveDependencies(*collection);
		});

		vector< string > affected;
		runStage(logger, Subsystem::Analysis, debugging, "post-processing", [&collection, &affected, postProcessing]()
		{
			affected = analysis::postProcess(*collection, postProcessing);
		});
		auto postProcessingMessage = format2("post-processing '%s' affected %zu packages: %s",
				analysis::PostProcessing::strings[postProcessing], affected.size(), join(", ", affected));
		logger.log(Subsystem::Analysis, 1, postProcessingMessage);
		if (debugging)
		{
			debug2("%s", postProcessingMessage);
		}

		runStage(logger, Subsystem::Analysis, debugging, "attribution", [&collection]()
		{
			analysis::computePseudobytes(*collection);
		});
	}
	catch (Exception& e)
	{
		logger.loggedFatal2(Subsystem::Session, 1, format2, "analysis failed: %s", string(e.what()));
	}

	return collection;
}

}
