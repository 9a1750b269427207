// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <system_error> // IWYU pragma: export

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.
 */
[[gnu::const]]
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::system_category();
}

[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}

[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}
