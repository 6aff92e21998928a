// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CopyConfig.hxx"
#include "io/config/LineParser.hxx"

#include <fmt/core.h>

#include <string.h>

void
CopyConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "kernel_copy") == 0)
		config.kernel_copy = line.ExpectBoolAndEnd();
	else if (strcmp(word, "sparse") == 0)
		config.sparse = line.ExpectBoolAndEnd();
	else if (strcmp(word, "log_level") == 0)
		config.log_level = line.ExpectPositiveIntegerAndEnd();
	else
		throw LineParser::Error{fmt::format("Unknown option {:?}", word)};
}

CopyConfig
LoadCopyConfig(const std::filesystem::path &path)
{
	CopyConfig config;
	CopyConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);
	return config;
}
