// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <system_error>

namespace MaxMind {

/**
 * An error category for libmaxminddb status codes (MMDB_*_ERROR).
 */
class ErrorCategory final : public std::error_category {
public:
	const char *name() const noexcept override {
		return "maxminddb";
	}

	std::string message(int condition) const override;
};

extern ErrorCategory error_category;

[[nodiscard]] [[gnu::pure]]
inline std::system_error
MakeError(int status, const char *msg) noexcept
{
	return std::system_error(status, error_category, msg);
}

} // namespace MaxMind
