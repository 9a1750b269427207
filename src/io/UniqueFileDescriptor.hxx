// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor.  It closes the file
 * descriptor automatically in the destructor.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	[[nodiscard]]
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	[[nodiscard]]
	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	[[nodiscard]]
	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(const UniqueFileDescriptor &) = delete;

	[[nodiscard]]
	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool Close() noexcept {
		return IsDefined() && FileDescriptor::Close();
	}
};
