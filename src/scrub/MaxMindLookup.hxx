// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "GeoLookup.hxx"
#include "lib/maxminddb/Database.hxx"

namespace Scrub {

/**
 * A #CountryLookup implementation backed by a MaxMind DB file
 * (e.g. GeoLite2-Country.mmdb).
 */
class MaxMindCountryLookup final : public CountryLookup {
	MaxMind::Database db;

public:
	/**
	 * Throws std::system_error if the database cannot be opened.
	 */
	explicit MaxMindCountryLookup(const char *path)
		:db(path) {}

	/* virtual methods from class CountryLookup */
	GeoLookupResult LookupCountry(std::string_view address) noexcept override;
};

} // namespace Scrub
