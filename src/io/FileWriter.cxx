// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileWriter.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/SpanCast.hxx"

#include <cassert>
#include <cstring>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <fcntl.h>

static std::string
GetDirectory(const char *path) noexcept
{
	const char *slash = strrchr(path, '/');
	if (slash == nullptr)
		return ".";

	if (slash == path)
		return "/";

	return std::string(path, slash);
}

static std::pair<std::string, UniqueFileDescriptor>
MakeTempFileInDirectory(const std::string &directory, mode_t mode)
{
	unsigned r = rand();

	while (true) {
		auto path = directory + "/.tmp." + std::to_string(r);
		UniqueFileDescriptor fd;
		if (fd.Open(path.c_str(), O_CREAT|O_EXCL|O_WRONLY, mode))
			return {std::move(path), std::move(fd)};

		if (errno != EEXIST)
			throw FmtErrno("Failed to create '{}'", path);

		++r;
	}
}

FileWriter::FileWriter(const char *_path, mode_t mode)
	:path(_path)
{
	auto tmp = MakeTempFileInDirectory(GetDirectory(_path), mode);
	tmp_path = std::move(tmp.first);
	fd = std::move(tmp.second);
}

void
FileWriter::Allocate(off_t size) noexcept
{
	if (size > 0)
		fallocate(fd.Get(), FALLOC_FL_KEEP_SIZE, 0, size);
}

void
FileWriter::Write(std::span<const std::byte> src)
{
	assert(fd.IsDefined());

	while (!src.empty()) {
		ssize_t nbytes = fd.Write(src);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw FmtErrno("Failed to write to '{}'", tmp_path);
		}

		if (nbytes == 0)
			throw FmtRuntimeError("Short write to '{}'", tmp_path);

		src = src.subspan(nbytes);
	}
}

void
FileWriter::Write(std::string_view src)
{
	Write(AsBytes(src));
}

void
FileWriter::Commit()
{
	assert(fd.IsDefined());

	if (fdatasync(fd.Get()) < 0)
		throw FmtErrno("Failed to flush '{}'", tmp_path);

	if (!fd.Close()) {
		const int e = errno;
		unlink(tmp_path.c_str());
		errno = e;
		throw FmtErrno("Failed to commit '{}'", path);
	}

	if (rename(tmp_path.c_str(), path.c_str()) < 0) {
		const int e = errno;
		unlink(tmp_path.c_str());
		errno = e;
		throw FmtErrno("Failed to rename '{}' to '{}'",
			       tmp_path, path);
	}
}

void
FileWriter::Cancel() noexcept
{
	assert(fd.IsDefined());

	fd.Close();
	unlink(tmp_path.c_str());
}
