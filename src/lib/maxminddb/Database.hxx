// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <maxminddb.h>

#include <string_view>

namespace MaxMind {

/**
 * A MaxMind DB file (e.g. GeoLite2-Country.mmdb) opened read-only
 * via mmap().
 */
class Database {
	MMDB_s mmdb;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit Database(const char *path);

	~Database() noexcept {
		MMDB_close(&mmdb);
	}

	Database(const Database &) = delete;
	Database &operator=(const Database &) = delete;

	/**
	 * Look up the ISO 3166-1 country code of the given address
	 * (in textual IPv4 or IPv6 notation).  The returned string
	 * points into the database mapping and remains valid as long
	 * as this object exists.
	 *
	 * Returns an empty string if the address was not found or if
	 * the record has no country code.
	 *
	 * Throws std::system_error if the address could not be parsed
	 * (with the getaddrinfo() category) or if the database is
	 * corrupt (with MaxMind::error_category).
	 */
	std::string_view LookupCountryCode(const char *address) const;
};

} // namespace MaxMind
