// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>

#include <sys/stat.h>

/**
 * Load the whole contents of a regular file into a std::string.  No
 * character set conversion is applied.
 *
 * The attributes of the file which was read (obtained with fstat()
 * on the same file descriptor) are returned in #st.
 *
 * Throws on error (including files which are not regular or larger
 * than #max_size bytes).
 */
std::string
LoadStringFile(const char *path, struct stat &st,
	       std::size_t max_size=std::size_t(1) << 30);

/**
 * Like LoadStringFile(const char *, struct stat &, std::size_t), but
 * discards the file attributes.
 */
inline std::string
LoadStringFile(const char *path, std::size_t max_size=std::size_t(1) << 30)
{
	struct stat st;
	return LoadStringFile(path, st, max_size);
}
