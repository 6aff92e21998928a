// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempFile.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"
#include "io/copy/CopyConfig.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <string>

static void
ParseConfigLines(ConfigParser &parser, const char *const*lines)
{
	while (*lines != nullptr) {
		std::string line = *lines++;

		LineParser line_parser{line.data()};
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	}

	parser.Finish();
}

TEST(ConfigParserTest, Defaults)
{
	const CopyConfig config;
	EXPECT_TRUE(config.kernel_copy);
	EXPECT_TRUE(config.sparse);
	EXPECT_EQ(config.log_level, 1U);
}

TEST(ConfigParserTest, CopyConfig)
{
	static const char *const lines[] = {
		"# a comment",
		"",
		"   ",
		"kernel_copy no",
		"  sparse  no  ",
		"log_level 4",
		"sparse 'yes'",
		nullptr
	};

	CopyConfig config;
	CopyConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigLines(comment_parser, lines);

	EXPECT_FALSE(config.kernel_copy);
	EXPECT_TRUE(config.sparse);
	EXPECT_EQ(config.log_level, 4U);
}

TEST(ConfigParserTest, Malformed)
{
	for (const char *line : {"unknown_option yes",
				 "sparse",
				 "sparse maybe",
				 "sparse yes no",
				 "log_level 0",
				 "log_level -1",
				 "log_level many"}) {
		CopyConfig config;
		CopyConfigParser parser{config};
		CommentConfigParser comment_parser{parser};

		const char *const lines[] = {line, nullptr};
		EXPECT_THROW(ParseConfigLines(comment_parser, lines),
			     LineParser::Error) << line;
	}
}

TEST(ConfigParserTest, LoadCopyConfig)
{
	const TempDirectory dir;
	const auto path = dir("copy.conf");
	WriteTestFile(path,
		      "kernel_copy yes\n"
		      "# comment\n"
		      "\n"
		      "log_level 3");

	const auto config = LoadCopyConfig(path);
	EXPECT_TRUE(config.kernel_copy);
	EXPECT_TRUE(config.sparse);
	EXPECT_EQ(config.log_level, 3U);
}

TEST(ConfigParserTest, LineNumber)
{
	const TempDirectory dir;
	const auto path = dir("copy.conf");
	WriteTestFile(path,
		      "kernel_copy yes\n"
		      "\n"
		      "bogus 42\n");

	try {
		LoadCopyConfig(path);
		FAIL();
	} catch (const LineParser::Error &e) {
		EXPECT_EQ(GetFullMessage(e), path + ":3; Unknown option \"bogus\"");
	}
}

TEST(ConfigParserTest, MissingFile)
{
	const TempDirectory dir;

	try {
		LoadCopyConfig(dir("nonexistent.conf"));
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsFileNotFound(e));
	}
}
