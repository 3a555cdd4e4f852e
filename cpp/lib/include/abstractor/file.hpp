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
#ifndef ABSTRACTOR_FILE_SEEN
#define ABSTRACTOR_FILE_SEEN

/// @file

#include <abstractor/common.hpp>

namespace abstractor {

namespace internal {

struct FileImpl;

}

/// high-level interface to file routines
class ABSTRACTOR_API File
{
	internal::FileImpl* __impl;
	File(const File&) = delete;
	File& operator=(const File&) = delete;
 protected:
	/// @cond
	// throws if the file cannot be opened
	File(const string& path, const char* mode);
	/// @endcond
 public:
	/// constructor
	/**
	 * @warning You must not use constructed object if @a error is not empty.
	 *
	 * @param path path to file
	 * @param mode any value, accepted as @a mode in @c fopen(3)
	 * @param [out] error if open fails, human readable error will be placed here
	 */
	File(const string& path, const char* mode, string& error);
	/// destructor
	virtual ~File();
	/// reads new line
	/**
	 * Reads new line (that is, a sequence of characters which ends with newline
	 * character (@c "\n")).
	 *
	 * If the end of file was encountered when reading, newline character will be
	 * not added.
	 *
	 * The buffer stays valid until the next read operation.
	 *
	 * @param [in, out] buffer will contain a pointer to read data
	 * @param [out] size the size (in bytes) of the buffer, a value @c 0 means end of file
	 * @return reference to self
	 */
	File& rawGetLine(const char*& buffer, size_t& size);
	/// reads all available data from current position
	/**
	 * @param block container for read data
	 */
	void getFile(string& block);
	/// writes data
	/**
	 * @param data data to write
	 */
	void put(const string& data);
	/// @cond
	void unbufferedPut(const char* data, size_t size);
	/// @endcond

	/// checks for the end of file condition
	bool eof() const;
};

// File wrapper which throws on open errors
class ABSTRACTOR_API RequiredFile: public File
{
 public:
	/*
	 * Passes @a path and @a mode to File::File(). If file failed to open (i.e.
	 * !openError.empty()), throws the exception.
	 */
	RequiredFile(const string& path, const char* mode);
};

} // namespace

#endif
