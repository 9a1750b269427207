// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileDescriptor.hxx"

#include <unistd.h>

bool
FileDescriptor::Open(FileDescriptor dir, const char *pathname,
		     int flags, mode_t mode) noexcept
{
	fd = ::openat(dir.Get(), pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::Open(const char *pathname, int flags, mode_t mode) noexcept
{
	return Open(FileDescriptor(AT_FDCWD), pathname, flags, mode);
}

bool
FileDescriptor::Close() noexcept
{
	return ::close(Steal()) == 0;
}

ssize_t
FileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return ::read(fd, dest.data(), dest.size());
}

ssize_t
FileDescriptor::Write(std::span<const std::byte> src) const noexcept
{
	return ::write(fd, src.data(), src.size());
}
