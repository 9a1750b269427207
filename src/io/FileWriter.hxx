// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueFileDescriptor.hxx"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

/**
 * Create a new file or replace an existing file atomically.  The data
 * is written to a temporary file in the same directory, which is
 * renamed over the destination by Commit().  Until then, the
 * destination is not touched; if the object is destroyed without
 * Commit(), the temporary file is deleted.
 */
class FileWriter {
	std::string path;

	std::string tmp_path;

	UniqueFileDescriptor fd;

public:
	FileWriter() = default;

	/**
	 * Throws std::system_error on error.
	 */
	explicit FileWriter(const char *_path, mode_t mode=0666);

	~FileWriter() noexcept {
		if (fd.IsDefined())
			Cancel();
	}

	FileWriter(FileWriter &&src) noexcept = default;

	FileWriter &operator=(FileWriter &&src) noexcept {
		if (IsDefined())
			Cancel();

		path = std::move(src.path);
		tmp_path = std::move(src.tmp_path);
		fd = std::move(src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd.IsDefined();
	}

	FileDescriptor GetFileDescriptor() noexcept {
		return fd;
	}

	const std::string &GetTemporaryPath() const noexcept {
		return tmp_path;
	}

	/**
	 * Attempt to allocate space on the file system.  This may
	 * speed up following writes, and may reduce file system
	 * fragmentation.  This is a hint, and there is no error
	 * checking.
	 */
	void Allocate(off_t size) noexcept;

	/**
	 * Throws std::runtime_error on error.
	 */
	void Write(std::span<const std::byte> src);

	void Write(std::string_view src);

	/**
	 * Flush the data to disk and rename the temporary file to the
	 * final path.
	 *
	 * Throws std::system_error on error; the temporary file has
	 * been deleted then.
	 */
	void Commit();

	/**
	 * Discard the temporary file.
	 */
	void Cancel() noexcept;
};
