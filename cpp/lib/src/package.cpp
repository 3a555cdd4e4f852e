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
#include <abstractor/package.hpp>

#include <internal/common.hpp>

namespace abstractor {

const string PackageDetails::RelationTypes::strings[] = {
	N__("Requires"), N__("Advises"), N__("Suggests"), N__("Supplements"), N__("Enhances")
};

PackageDetails::PackageDetails()
	: installedBytes(0), claimantCount(0),
	mandatoryPseudobytes(0), optionalPseudobytes(0)
{}

double PackageDetails::getTotalPseudobytes() const
{
	return mandatoryPseudobytes + optionalPseudobytes;
}

double PackageDetails::getTotalAttributedBytes() const
{
	return installedBytes + getTotalPseudobytes();
}

bool PackageDetails::getCostRatios(CostRatios* ratios) const
{
	auto total = getTotalAttributedBytes();
	if (total <= 0)
	{
		return false;
	}
	ratios->installed = installedBytes / total;
	ratios->mandatory = mandatoryPseudobytes / total;
	ratios->optional = optionalPseudobytes / total;
	return true;
}

void PackageDetails::clearComputedFields()
{
	recursiveRequires.clear();
	recursiveComplements.clear();
	recursiveWhatRequires.clear();
	recursiveWhatComplements.clear();
	claimantCount = 0;
	mandatoryPseudobytes = 0;
	optionalPseudobytes = 0;
}

}
