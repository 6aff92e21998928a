// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempFile.hxx"
#include "io/BufferedReader.hxx"
#include "io/config/LineParser.hxx"

#include <gtest/gtest.h>

#include <string>

TEST(LineParser, Words)
{
	std::string s = "  foo_1   bar\t";
	LineParser line{s.data()};

	EXPECT_STREQ(line.ExpectWord(), "foo_1");
	EXPECT_FALSE(line.IsEnd());
	EXPECT_STREQ(line.NextWord(), "bar");
	EXPECT_TRUE(line.IsEnd());
	EXPECT_EQ(line.NextWord(), nullptr);
	EXPECT_THROW(line.ExpectWord(), LineParser::Error);
}

TEST(LineParser, NoWordBoundary)
{
	std::string s = "foo=bar";
	LineParser line{s.data()};

	EXPECT_EQ(line.NextWord(), nullptr);
	EXPECT_EQ(line.front(), 'f');
}

TEST(LineParser, Values)
{
	std::string s = "plain 'single quoted' \"double quoted\" /a/b.c";
	LineParser line{s.data()};

	EXPECT_STREQ(line.NextValue(), "plain");
	EXPECT_STREQ(line.NextValue(), "single quoted");
	EXPECT_STREQ(line.NextValue(), "double quoted");
	EXPECT_STREQ(line.NextValue(), "/a/b.c");
	EXPECT_TRUE(line.IsEnd());
	EXPECT_NO_THROW(line.ExpectEnd());
}

TEST(LineParser, UnterminatedQuote)
{
	std::string s = "'foo";
	LineParser line{s.data()};

	EXPECT_EQ(line.NextValue(), nullptr);
}

TEST(LineParser, Bool)
{
	std::string s = "yes no";
	LineParser line{s.data()};

	EXPECT_TRUE(line.ExpectBool());
	EXPECT_FALSE(line.ExpectBoolAndEnd());

	std::string s2 = "true";
	LineParser line2{s2.data()};
	EXPECT_THROW(line2.ExpectBool(), LineParser::Error);
}

TEST(LineParser, PositiveInteger)
{
	std::string s = "42";
	EXPECT_EQ(LineParser{s.data()}.ExpectPositiveIntegerAndEnd(), 42U);

	for (const char *bad : {"0", "-1", "+1", "1x", "x", "99999999999", ""}) {
		std::string b = bad;
		LineParser line{b.data()};
		EXPECT_THROW(line.ExpectPositiveInteger(), LineParser::Error) << bad;
	}
}

TEST(LineParser, Comment)
{
	std::string s = "  # comment";
	LineParser line{s.data()};

	EXPECT_TRUE(line.IsComment());
	EXPECT_FALSE(line.IsEnd());
}

TEST(BufferedReader, Lines)
{
	const TempDirectory dir;
	const auto path = dir("lines.txt");
	WriteTestFile(path, "first\n\nthird\nlast");

	const auto fd = OpenReadOnly(path.c_str());
	BufferedReader reader{fd};

	EXPECT_STREQ(reader.ReadLine(), "first");
	EXPECT_EQ(reader.GetLineNumber(), 1U);
	EXPECT_STREQ(reader.ReadLine(), "");
	EXPECT_STREQ(reader.ReadLine(), "third");
	EXPECT_STREQ(reader.ReadLine(), "last");
	EXPECT_EQ(reader.GetLineNumber(), 4U);
	EXPECT_EQ(reader.ReadLine(), nullptr);
	EXPECT_EQ(reader.ReadLine(), nullptr);
}

TEST(BufferedReader, ManyLines)
{
	const TempDirectory dir;
	const auto path = dir("lines.txt");

	std::string data;
	for (unsigned i = 0; i < 10000; ++i)
		data += std::to_string(i) + '\n';
	WriteTestFile(path, data);

	const auto fd = OpenReadOnly(path.c_str());
	BufferedReader reader{fd};

	for (unsigned i = 0; i < 10000; ++i)
		ASSERT_EQ(reader.ReadLine(), std::to_string(i));

	EXPECT_EQ(reader.ReadLine(), nullptr);
	EXPECT_EQ(reader.GetLineNumber(), 10000U);
}

TEST(BufferedReader, LineTooLong)
{
	const TempDirectory dir;
	const auto path = dir("long.txt");
	WriteTestFile(path, std::string(100000, 'x'));

	const auto fd = OpenReadOnly(path.c_str());
	BufferedReader reader{fd};

	EXPECT_THROW(reader.ReadLine(), std::runtime_error);
}
