// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fcntl.h>

UniqueFileDescriptor
OpenReadOnly(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_RDONLY))
		throw FmtErrno("Failed to open '{}'", path);

	return fd;
}

UniqueFileDescriptor
CreateTruncate(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_WRONLY|O_CREAT|O_TRUNC))
		throw FmtErrno("Failed to create '{}'", path);

	return fd;
}
