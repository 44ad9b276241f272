/*
 * Unit tests for src/playlist/FileName.cpp
 */

#include "playlist/FileName.hpp"

#include <gtest/gtest.h>

using playlist::playlist_filename;
using playlist::sanitize_filename;

TEST(FileName, ReplacesReservedCharacters)
{
	EXPECT_EQ(sanitize_filename("Road/Trip"), "Road-Trip");
	EXPECT_EQ(sanitize_filename("a\\b:c*d?e\"f<g>h|i"), "a-b-c-d-e-f-g-h-i");
	EXPECT_EQ(sanitize_filename("/\\:*?\"<>|"), "---------");
}

TEST(FileName, KeepsEverythingElse)
{
	EXPECT_EQ(sanitize_filename("Chill Vibes #2 (2023)"),
		  "Chill Vibes #2 (2023)");
	EXPECT_EQ(sanitize_filename("Café · 日本語"), "Café · 日本語");
}

TEST(FileName, TrimsOuterWhitespaceOnly)
{
	EXPECT_EQ(sanitize_filename("  Morning  Run \t"), "Morning  Run");
	EXPECT_EQ(sanitize_filename(" / "), "-");
}

TEST(FileName, TrimsUnicodeWhitespace)
{
	/* U+00A0 and U+3000 */
	EXPECT_EQ(sanitize_filename("\xC2\xA0Mix\xE3\x80\x80"), "Mix");
	/* U+2003, U+0085, U+202F, U+205F, U+1680, U+2028 */
	EXPECT_EQ(sanitize_filename("\xE2\x80\x83\xC2\x85 Mix \xE2\x80\xAF\xE2\x81\x9F"),
		  "Mix");
	EXPECT_EQ(sanitize_filename("\xE1\x9A\x80Mix\xE2\x80\xA8"), "Mix");
	/* interior no-break space is kept */
	EXPECT_EQ(sanitize_filename("Road\xC2\xA0Trip"), "Road\xC2\xA0Trip");
	EXPECT_EQ(sanitize_filename("\xC2\xA0\xE3\x80\x80"), "");
}

TEST(FileName, KeepsNonSpaceMultibyteEdges)
{
	/* U+00E9 and U+3001 share lead bytes with space code points */
	EXPECT_EQ(sanitize_filename("\xC3\xA9t\xC3\xA9"), "\xC3\xA9t\xC3\xA9");
	EXPECT_EQ(sanitize_filename("\xE3\x80\x81" "a" "\xE3\x80\x81"),
		  "\xE3\x80\x81" "a" "\xE3\x80\x81");
	EXPECT_EQ(sanitize_filename("a\xE2\x80\x8B"), "a\xE2\x80\x8B");
}

TEST(FileName, EmptyOnlyForBlankInput)
{
	EXPECT_EQ(sanitize_filename(""), "");
	EXPECT_EQ(sanitize_filename("   "), "");
	EXPECT_FALSE(sanitize_filename(" ? ").empty());
}

TEST(FileName, AppendsExtension)
{
	EXPECT_EQ(playlist_filename("Road/Trip", "html"), "Road-Trip.html");
	EXPECT_EQ(playlist_filename(" Focus ", "md"), "Focus.md");
	EXPECT_EQ(playlist_filename("", "md"), ".md");
}

TEST(FileName, CollidingNamesAreNotDisambiguated)
{
	EXPECT_EQ(playlist_filename("a/b", "md"), playlist_filename("a:b", "md"));
}
