/**************************************************************************
*   Copyright (C) 2010-2011 by Eugene V. Lyubimkin                        *
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
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>

#include <abstractor/file.hpp>

namespace abstractor {
namespace internal {

struct FileImpl
{
	FILE* handle;
	const string path;
	bool eof;
	int fd;
	char* lineBuffer;
	size_t lineBufferCapacity;

	FileImpl(const string& path_, const char* mode, string& openError);
	~FileImpl();
	inline void assertFileOpened() const;
};

FileImpl::FileImpl(const string& path_, const char* mode, string& openError)
	: handle(NULL), path(path_), eof(false), fd(-1),
	lineBuffer(NULL), lineBufferCapacity(0)
{
	handle = fopen(path.c_str(), mode);

	if (!handle)
	{
		openError = format2e("").substr(2);
	}
	else
	{
		// setting FD_CLOEXEC flag
		fd = fileno(handle);
		int oldFdFlags = fcntl(fd, F_GETFD);
		if (oldFdFlags < 0)
		{
			openError = format2e("unable to get file descriptor flags");
		}
		else
		{
			if (fcntl(fd, F_SETFD, oldFdFlags | FD_CLOEXEC) == -1)
			{
				openError = format2e("unable to set the close-on-exec flag");
			}
		}
	}
}

FileImpl::~FileImpl()
{
	free(lineBuffer);
	if (handle)
	{
		if (fclose(handle))
		{
			warn2e(__("unable to close the file '%s'"), path);
		}
	}
}

void FileImpl::assertFileOpened() const
{
	if (!handle)
	{
		// file was not properly opened
		fatal2i("file '%s' was not properly opened", path);
	}
}

}

File::File(const string& path, const char* mode, string& openError)
	: __impl(new internal::FileImpl(path, mode, openError))
{}

File::File(const string& path, const char* mode)
	: __impl(NULL)
{
	string openError;
	unique_ptr< internal::FileImpl > impl(new internal::FileImpl(path, mode, openError));
	if (!openError.empty())
	{
		fatal2(__("unable to open the file '%s': %s"), path, openError);
	}
	__impl = impl.release();
}

File::~File()
{
	delete __impl;
}

File& File::rawGetLine(const char*& buffer, size_t& size)
{
	__impl->assertFileOpened();

	errno = 0;
	auto readResult = getline(&__impl->lineBuffer, &__impl->lineBufferCapacity, __impl->handle);
	if (readResult == -1)
	{
		if (errno && errno != EINTR && ferror(__impl->handle))
		{
			fatal2e(__("unable to read from the file '%s'"), __impl->path);
		}
		__impl->eof = true;
		buffer = "";
		size = 0;
	}
	else
	{
		buffer = __impl->lineBuffer;
		size = readResult;
	}
	return *this;
}

void File::getFile(string& block)
{
	block.clear();

	const char* buffer;
	size_t size;
	while (rawGetLine(buffer, size), size)
	{
		block.append(buffer, size);
	}
}

void File::put(const string& data)
{
	__impl->assertFileOpened();
	if (fwrite(data.c_str(), data.size(), 1, __impl->handle) != 1 && !data.empty())
	{
		fatal2e(__("unable to write to the file '%s'"), __impl->path);
	}
}

void File::unbufferedPut(const char* data, size_t size)
{
	__impl->assertFileOpened();
	if (fflush(__impl->handle) == EOF)
	{
		fatal2e(__("unable to flush the file '%s'"), __impl->path);
	}

	size_t currentOffset = 0;
	while (currentOffset < size)
	{
		auto writeResult = write(__impl->fd, data + currentOffset, size - currentOffset);
		if (writeResult == -1)
		{
			if (errno == EINTR)
			{
				continue;
			}
			fatal2e(__("unable to write to the file '%s'"), __impl->path);
		}
		currentOffset += writeResult;
	}
}

bool File::eof() const
{
	return __impl->eof;
}

RequiredFile::RequiredFile(const string& path, const char* mode)
	: File(path, mode)
{}

}
