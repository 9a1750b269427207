// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringFile.hxx"
#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <algorithm>
#include <span>

std::string
LoadStringFile(const char *path, struct stat &st, std::size_t max_size)
{
	auto fd = OpenReadOnly(path);

	if (fstat(fd.Get(), &st) < 0)
		throw FmtErrno("Failed to stat '{}'", path);

	if (!S_ISREG(st.st_mode))
		throw FmtRuntimeError("Not a regular file: '{}'", path);

	if (std::size_t(st.st_size) > max_size)
		throw FmtRuntimeError("File is too large: '{}'", path);

	std::string result;
	result.resize(st.st_size);

	std::size_t fill = 0;
	while (true) {
		if (fill == result.size()) {
			/* the file may have grown since fstat() */
			if (result.size() >= max_size) {
				std::byte extra[1];
				if (fd.Read(extra) != 0)
					throw FmtRuntimeError("File is too large: '{}'", path);
				break;
			}

			result.resize(std::min(result.size() * 2 + 4096,
					       max_size));
		}

		auto dest = std::as_writable_bytes(std::span{result}.subspan(fill));
		const auto nbytes = fd.Read(dest);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw FmtErrno("Failed to read '{}'", path);
		}

		if (nbytes == 0)
			break;

		fill += nbytes;
	}

	result.resize(fill);
	return result;
}
