// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/config/ConfigParser.hxx"

#include <filesystem>

/**
 * Tunables for CopyRegularFile().
 */
struct CopyConfig {
	/**
	 * Try copy_file_range() before copying in user space?
	 */
	bool kernel_copy = true;

	/**
	 * Copy only the data segments of sparse files?
	 */
	bool sparse = true;

	/**
	 * @see SetLogLevel()
	 */
	unsigned log_level = 1;
};

/**
 * Parses the lines of a copy configuration file, e.g.:
 *
 *     kernel_copy yes
 *     sparse no
 *     log_level 4
 */
class CopyConfigParser final : public ConfigParser {
	CopyConfig &config;

public:
	explicit CopyConfigParser(CopyConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
};

/**
 * Load a #CopyConfig from a file.  Empty lines and comments are
 * allowed.
 *
 * Throws on error.
 */
CopyConfig
LoadCopyConfig(const std::filesystem::path &path);
