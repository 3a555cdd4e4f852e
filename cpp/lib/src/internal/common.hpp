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
#ifndef ABSTRACTOR_INTERNAL_COMMON_SEEN
#define ABSTRACTOR_INTERNAL_COMMON_SEEN

#include <abstractor/common.hpp>

namespace abstractor {
namespace internal {

void chomp(string& str);
string trim(const string& str);

vector< string > split(char, const string&, bool allowEmpty = false);

// we may use following instead of boost::lexical_cast<> because of speed
uint64_t string2uint64(pair< string::const_iterator, string::const_iterator > input);

// "123", "12.5 MB", "3 KiB" -> bytes
uint64_t humanToBytes(const string& input);

} // namespace
} // namespace

#define N__(arg) arg

#endif
