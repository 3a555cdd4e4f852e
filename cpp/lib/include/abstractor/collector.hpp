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
#ifndef ABSTRACTOR_COLLECTOR_SEEN
#define ABSTRACTOR_COLLECTOR_SEEN

/// @file

#include <abstractor/common.hpp>
#include <abstractor/fwd.hpp>
#include <abstractor/analysis.hpp>

namespace abstractor {

/// source of installed package records
class ABSTRACTOR_API Collector
{
 public:
	virtual ~Collector();

	/// puts collected records into the empty collection
	virtual void collect(PackageCollection&) = 0;
	/// @return reclassification policy suitable for the collected data
	virtual analysis::PostProcessing::Type getDefaultPostProcessing() const = 0;

	/// creates the collector selected by the option @c abstractor::collector
	static unique_ptr< Collector > create(const Config&);
};

namespace collectors {

/// reads records from a text file of Debian control-like stanzas
class ABSTRACTOR_API RecordFileCollector: public Collector
{
	const string __path;
 public:
	RecordFileCollector(const string& path);
	void collect(PackageCollection&);
	analysis::PostProcessing::Type getDefaultPostProcessing() const;
};

/// reads installed packages from the dpkg status database
/**
 * System packages are skipped. Packages which are automatically installed
 * according to APT extended states or the APT history log, and libraries
 * never explicitly installed according to the history log, go to the
 * lower tier. Packages installed without a requesting user in the history
 * log (e.g. by the OS installer) are treated as system ones.
 */
class ABSTRACTOR_API DpkgCollector: public Collector
{
	const string __status_path;
	const string __extended_states_path;
	const string __history_path;
	const vector< string > __system_priorities;
	const vector< string > __system_sections;
	const vector< string > __support_sections;
	const bool __debugging;
 public:
	DpkgCollector(const Config&);
	void collect(PackageCollection&);
	analysis::PostProcessing::Type getDefaultPostProcessing() const;
};

}

/// collects, analyses and reclassifies packages
/**
 * Runs, in order: collection, closure computation, post-processing (chosen
 * by the option @c abstractor::post-process or collector's default), cost
 * attribution.
 */
ABSTRACTOR_API shared_ptr< PackageCollection > manufacturePackageCollection(
		const Config&, Collector&);

}

#endif
