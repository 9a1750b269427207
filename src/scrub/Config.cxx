// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "ExclusionList.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"
#include "util/StringCompare.hxx"
#include "util/StringSplit.hxx"

#include <string_view>

namespace Scrub {

ExclusionList
Config::MakeExclusionList() const
{
	if (default_exclusions)
		return ExclusionList::Default().With(exclusions);

	return {exclusions.begin(), exclusions.end()};
}

class ScrubConfigParser final : public ConfigParser {
	Config &config;

	/**
	 * The directory containing the configuration file, with a
	 * trailing slash; empty if the file name has no directory
	 * part.
	 */
	const std::string directory;

public:
	ScrubConfigParser(Config &_config, std::string_view _directory) noexcept
		:config(_config), directory(_directory) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;

private:
	std::string ExpectPath(LineParser &line) const;
};

std::string
ScrubConfigParser::ExpectPath(LineParser &line) const
{
	const char *value = line.NextUnescape();
	if (value == nullptr || *value == 0)
		throw LineParser::Error{"Path expected"};

	line.ExpectEnd();

	if (*value == '/' || directory.empty())
		return value;

	return directory + value;
}

void
ScrubConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "mode")) {
		const char *value = line.ExpectValueAndEnd();
		if (StringIsEqual(value, "country"))
			config.mode = RedactionMode::COUNTRY_CODE;
		else if (StringIsEqual(value, "mask"))
			config.mode = RedactionMode::MASK;
		else
			throw LineParser::Error{"Unknown mode"};
	} else if (StringIsEqual(word, "database")) {
		config.database_path = ExpectPath(line);
	} else if (StringIsEqual(word, "log")) {
		config.log_path = ExpectPath(line);
	} else if (StringIsEqual(word, "default_exclusions")) {
		config.default_exclusions = line.NextBool();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "exclude")) {
		const char *value = line.NextUnescape();
		if (value == nullptr || *value == 0)
			throw LineParser::Error{"Address expected"};

		line.ExpectEnd();
		config.exclusions.emplace_back(value);
	} else
		throw LineParser::Error{"Unknown option"};
}

void
LoadConfigFile(Config &config, const char *path)
{
	const auto [directory, name] = SplitLast(std::string_view{path}, '/');

	/* include the trailing slash */
	ScrubConfigParser parser(config,
				 name.data() != nullptr
				 ? std::string_view{path, directory.size() + 1}
				 : std::string_view{});
	CommentConfigParser comment_parser(parser);
	ParseConfigFile(path, comment_parser);
}

} // namespace Scrub
