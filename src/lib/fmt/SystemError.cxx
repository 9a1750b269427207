// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SystemError.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>

std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::system_error{code, fmt::vformat(format_str, args)};
}

std::system_error
VFmtErrno(int code,
	  fmt::string_view format_str, fmt::format_args args) noexcept
{
	return VFmtSystemError(std::error_code(code, ErrnoCategory()),
			       format_str, args);
}
