// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

class LineParser;

/**
 * Receives the lines of a configuration file, one at a time.
 */
class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Handle lines which are not meant for ParseLine().
	 *
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine(LineParser &) {
		return false;
	}

	virtual void ParseLine(LineParser &line) = 0;

	/**
	 * Called after the last line.  Throws if the configuration
	 * is incomplete.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Parse the given file line by line.  Errors are wrapped in a
 * #LineParser::Error which carries the file name and line number.
 *
 * Throws on error.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
