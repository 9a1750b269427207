// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;

	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	bool Open(FileDescriptor dir, const char *pathname,
		  int flags, mode_t mode=0666) noexcept;
	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept;

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 */
	bool Close() noexcept;

	ssize_t Read(std::span<std::byte> dest) const noexcept;

	ssize_t Write(std::span<const std::byte> src) const noexcept;
};
