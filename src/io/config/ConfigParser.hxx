// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Gives the parser a chance to consume the line before
	 * ParseLine() is called.  Returns true if the line has been
	 * handled.
	 */
	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) final;
	void Finish() override;
};

/**
 * Feed all lines of the given file to the parser and call
 * ConfigParser::Finish().  Errors are rethrown nested inside an
 * exception whose message contains the file name and the line
 * number.
 */
void
ParseConfigFile(const char *path, ConfigParser &parser);
