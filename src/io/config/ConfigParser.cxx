// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "io/StringFile.hxx"
#include "util/StringSplit.hxx"

#include <fmt/format.h>

#include <exception>
#include <string>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
ParseConfigFile(const char *path, ConfigParser &parser)
{
	const auto contents = LoadStringFile(path, 1024 * 1024);

	std::string_view rest = contents;
	std::string line;

	for (unsigned i = 1; rest.data() != nullptr; ++i) {
		const auto [current, next] = Split(rest, '\n');
		rest = next;

		if (next.data() == nullptr && current.empty())
			break;

		/* LineParser needs a writable null-terminated
		   buffer */
		line.assign(current);
		LineParser line_parser(line.data());

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path, i)});
		}
	}

	parser.Finish();
}
