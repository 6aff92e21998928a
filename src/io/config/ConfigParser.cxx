// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "io/BufferedReader.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <fmt/core.h>

#include <exception>

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line) || line.IsEnd() || line.IsComment();
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
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	const auto fd = OpenReadOnly(path.c_str());
	BufferedReader reader{fd};

	while (char *const s = reader.ReadLine()) {
		LineParser line{s};

		try {
			if (!parser.PreParseLine(line))
				parser.ParseLine(line);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{
					fmt::format("{}:{}", path.native(),
						    reader.GetLineNumber())});
		}
	}

	parser.Finish();
}
