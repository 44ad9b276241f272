/*
 * Unit tests for src/playlist/OutputFormat.cpp
 */

#include "playlist/OutputFormat.hpp"

#include <gtest/gtest.h>

using playlist::OutputFormat;
using playlist::parse_output_format;

TEST(OutputFormat, ParseIsCaseInsensitive)
{
	EXPECT_EQ(parse_output_format("markdown"), OutputFormat::Markdown);
	EXPECT_EQ(parse_output_format("MarkDown"), OutputFormat::Markdown);
	EXPECT_EQ(parse_output_format("html"), OutputFormat::Html);
	EXPECT_EQ(parse_output_format("HTML"), OutputFormat::Html);
}

TEST(OutputFormat, RejectsOtherValues)
{
	EXPECT_FALSE(parse_output_format(""));
	EXPECT_FALSE(parse_output_format("md"));
	EXPECT_FALSE(parse_output_format("pdf"));
	EXPECT_FALSE(parse_output_format(" html"));
}

TEST(OutputFormat, Names)
{
	EXPECT_STREQ(playlist::file_extension(OutputFormat::Markdown), "md");
	EXPECT_STREQ(playlist::file_extension(OutputFormat::Html), "html");
	EXPECT_STREQ(playlist::format_name(OutputFormat::Html), "html");
	EXPECT_EQ(playlist::index_filename(OutputFormat::Markdown), "index.md");
	EXPECT_EQ(playlist::index_filename(OutputFormat::Html), "index.html");
}
