// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Policy.hxx"

#include <string>
#include <vector>

namespace Scrub {

class ExclusionList;

struct Config {
	static constexpr const char *DEFAULT_DATABASE_PATH =
		"/usr/local/share/GeoIP/GeoLite2-Country.mmdb";

	RedactionMode mode = RedactionMode::MASK;

	std::string database_path = DEFAULT_DATABASE_PATH;

	/**
	 * The log file.  An empty string means standard error.
	 */
	std::string log_path;

	/**
	 * Include the built-in list (see ExclusionList::Default())?
	 */
	bool default_exclusions = true;

	/**
	 * Additional addresses which are never transformed.
	 */
	std::vector<std::string> exclusions;

	/**
	 * Build the #ExclusionList from #default_exclusions and
	 * #exclusions.
	 */
	ExclusionList MakeExclusionList() const;
};

/**
 * Load a configuration file and apply its settings to the given
 * #Config object.  Relative paths in the file are relative to the
 * directory containing it.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const char *path);

} // namespace Scrub
