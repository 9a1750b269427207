// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Engine.hxx"
#include "ExclusionList.hxx"
#include "MaxMindLookup.hxx"
#include "Scanner.hxx"
#include "ScrubFile.hxx"
#include "io/Logger.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <system_error>

using std::string_view_literals::operator""sv;

using namespace Scrub;

static Config
LoadConfig(const CommandLine &cmdline)
{
	Config config;

	if (cmdline.config_path != nullptr)
		LoadConfigFile(config, cmdline.config_path);

	if (cmdline.country)
		config.mode = RedactionMode::COUNTRY_CODE;

	if (cmdline.database_path != nullptr)
		config.database_path = cmdline.database_path;

	if (cmdline.log_path != nullptr)
		config.log_path = cmdline.log_path;

	config.exclusions.insert(config.exclusions.end(),
				 cmdline.exclusions.begin(),
				 cmdline.exclusions.end());

	return config;
}

/**
 * Open the country database.  Failure is not fatal: it is logged,
 * and all addresses will be masked.
 */
static std::unique_ptr<CountryLookup>
OpenCountryLookup(const LLogger &logger, const Config &config)
try {
	auto lookup = std::make_unique<MaxMindCountryLookup>(config.database_path.c_str());
	logger.Fmt(4, "Opened country database '{}'"sv, config.database_path);
	return lookup;
} catch (const std::system_error &) {
	logger(1, "Country database not available, masking all addresses: ",
	       std::current_exception());
	return nullptr;
}

static void
LogStats(const LLogger &logger, const char *path,
	 const RedactionStats &stats) noexcept
{
	logger.Fmt(3, "Scrubbed '{}': {} addresses, {} excluded, {} masked, {} country codes, {} lookup failures"sv,
		   path, stats.candidates, stats.excluded, stats.masked,
		   stats.country, stats.lookup_failures);

	if (stats.scanner_errors > 0)
		logger.Fmt(2, "Skipped {} bytes after pattern matching errors"sv,
			   stats.scanner_errors);
}

int
main(int argc, char **argv) noexcept
try {
	const LLogger logger("geoscrub"sv);

	const auto cmdline = ParseCommandLine(argc, argv);

	SetLogLevel(cmdline.log_level);

	const auto config = LoadConfig(cmdline);

	if (!config.log_path.empty())
		SetLogFile(OpenAppend(config.log_path.c_str()));

	const AddressPattern pattern;
	const auto exclusions = config.MakeExclusionList();

	std::unique_ptr<CountryLookup> lookup;
	if (config.mode == RedactionMode::COUNTRY_CODE)
		lookup = OpenCountryLookup(logger, config);

	const RedactionEngine engine(pattern, exclusions, config.mode,
				     lookup.get());

	RedactionStats stats;
	ScrubFile(cmdline.path, engine, stats);

	LogStats(logger, cmdline.path, stats);
	return EXIT_SUCCESS;
} catch (const Usage &usage) {
	LogConcat(1, "geoscrub"sv, usage.message);
	fprintf(stderr, "Usage: geoscrub"
		" [--country] [--database=PATH] [--config=PATH]"
		" [--log=PATH] [--exclude=ADDRESS]... [--verbose] [--quiet]"
		" FILE\n");
	return EXIT_FAILURE;
} catch (...) {
	LogConcat(1, "geoscrub"sv, std::current_exception());
	return EXIT_FAILURE;
}
