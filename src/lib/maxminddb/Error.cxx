// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <maxminddb.h>

namespace MaxMind {

ErrorCategory error_category;

std::string
ErrorCategory::message(int condition) const
{
	return MMDB_strerror(condition);
}

} // namespace MaxMind
