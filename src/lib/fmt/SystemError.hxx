// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <system_error> // IWYU pragma: export

#include <errno.h>

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtSystemError(std::error_code code,
	       const S &format_str, Args&&... args) noexcept
{
	return VFmtSystemError(code, format_str,
			       fmt::make_format_args(args...));
}

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtErrno(int code,
	  fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Build a std::system_error from the current errno value with a
 * formatted message.
 */
template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	const int code = errno;
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}
