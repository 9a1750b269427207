// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fcntl.h>

UniqueFileDescriptor
OpenReadOnly(const char *path, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_RDONLY|flags))
		throw FmtErrno("Failed to open '{}'", path);

	return fd;
}

UniqueFileDescriptor
OpenAppend(const char *path, mode_t mode)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_WRONLY|O_APPEND|O_CREAT, mode))
		throw FmtErrno("Failed to open '{}'", path);

	return fd;
}
