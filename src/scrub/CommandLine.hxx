// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <vector>

namespace Scrub {

/**
 * Thrown by ParseCommandLine() if the command line is not valid.
 * The caller prints the usage text.
 */
struct Usage {
	/**
	 * A static string describing the problem.
	 */
	const char *message;
};

/**
 * Settings from the command line.  They override the configuration
 * file.
 */
struct CommandLine {
	const char *path = nullptr;

	const char *config_path = nullptr;
	const char *database_path = nullptr;
	const char *log_path = nullptr;

	std::vector<std::string> exclusions;

	unsigned log_level = 3;

	bool country = false;
};

/**
 * Parse the arguments passed to main().  argv[0] is skipped; an
 * empty argument vector (argc==0) is allowed and is rejected like a
 * missing file name.
 *
 * Throws #Usage on error.
 */
CommandLine
ParseCommandLine(int argc, const char *const*argv);

} // namespace Scrub
