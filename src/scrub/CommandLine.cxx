// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "util/StringCompare.hxx"

#include <span>

namespace Scrub {

CommandLine
ParseCommandLine(int argc, const char *const*argv)
{
	if (argc < 2)
		throw Usage{"No file name specified"};

	CommandLine cmdline;

	for (const char *arg : std::span{argv + 1, std::size_t(argc - 1)}) {
		if (*arg != '-') {
			if (cmdline.path != nullptr)
				throw Usage{"Too many file names"};

			cmdline.path = arg;
		} else if (StringIsEqual(arg, "--country") ||
			   StringIsEqual(arg, "-c")) {
			cmdline.country = true;
		} else if (const char *database = StringAfterPrefix(arg, "--database=")) {
			cmdline.database_path = database;
		} else if (const char *config = StringAfterPrefix(arg, "--config=")) {
			cmdline.config_path = config;
		} else if (const char *log = StringAfterPrefix(arg, "--log=")) {
			cmdline.log_path = log;
		} else if (const char *exclude = StringAfterPrefix(arg, "--exclude=")) {
			if (*exclude == 0)
				throw Usage{"Empty exclusion"};

			cmdline.exclusions.emplace_back(exclude);
		} else if (StringIsEqual(arg, "--verbose") ||
			   StringIsEqual(arg, "-v")) {
			cmdline.log_level = 4;
		} else if (StringIsEqual(arg, "--quiet") ||
			   StringIsEqual(arg, "-q")) {
			cmdline.log_level = 1;
		} else
			throw Usage{"Unknown option"};
	}

	if (cmdline.path == nullptr)
		throw Usage{"No file name specified"};

	return cmdline;
}

} // namespace Scrub
