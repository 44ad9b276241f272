/*
 * Unit tests for src/commands/export.cpp
 */

#include "commands/export.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static const char *const road_trip_json = R"({"playlists":[{"name":"Road/Trip","lastModifiedDate":"2023-01-01","collaborators":[],"items":[{"track":{"trackName":"A & B","artistName":"X","albumName":"Y","trackUri":"spotify:track:1"},"episode":null,"audiobook":null,"localTrack":null,"addedDate":"2023-01-02"}],"description":null,"numberOfFollowers":5}]})";

class ExportCommandTest : public ::testing::Test {
protected:
	fs::path dir;
	fs::path input;

	void SetUp() override {
		const auto* info =
			::testing::UnitTest::GetInstance()->current_test_info();
		dir = fs::temp_directory_path() /
			(std::string("playlist_docs_cmd_") + info->name());
		fs::remove_all(dir);
		fs::create_directories(dir);

		input = dir / "playlists.json";
		WriteInput(road_trip_json);
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(dir, ec);
	}

	void WriteInput(const std::string& text) {
		std::ofstream out(input, std::ios::binary | std::ios::trunc);
		out << text;
	}

	/* runs the command with argv[0] = "playlist-docs" */
	static int Run(std::vector<std::string> args) {
		args.insert(args.begin(), "playlist-docs");

		std::vector<char*> argv;
		for (auto& a : args)
			argv.push_back(a.data());
		argv.push_back(nullptr);

		return cmd_export(static_cast<int>(args.size()), argv.data());
	}
};

TEST_F(ExportCommandTest, Success)
{
	const fs::path out = dir / "out";
	EXPECT_EQ(Run({"--input", input.string(), "--output", out.string(),
		       "--format", "HTML"}), 0);
	EXPECT_TRUE(fs::exists(out / "Road-Trip.html"));
	EXPECT_TRUE(fs::exists(out / "index.html"));
}

TEST_F(ExportCommandTest, ShortOptionsDefaultToMarkdown)
{
	const fs::path out = dir / "md";
	EXPECT_EQ(Run({"-i", input.string(), "-o", out.string()}), 0);
	EXPECT_TRUE(fs::exists(out / "Road-Trip.md"));
	EXPECT_TRUE(fs::exists(out / "index.md"));
}

TEST_F(ExportCommandTest, HelpAndVersion)
{
	EXPECT_EQ(Run({"--help"}), 0);
	EXPECT_EQ(Run({"-h"}), 0);
	EXPECT_EQ(Run({"--version"}), 0);
	EXPECT_EQ(Run({"-V"}), 0);
}

TEST_F(ExportCommandTest, InvalidFormat)
{
	const fs::path out = dir / "out";
	EXPECT_EQ(Run({"-i", input.string(), "-o", out.string(), "-f", "pdf"}), 1);
	EXPECT_FALSE(fs::exists(out));
}

TEST_F(ExportCommandTest, MissingInput)
{
	EXPECT_EQ(Run({}), 1);
	EXPECT_EQ(Run({"-f", "html"}), 1);
}

TEST_F(ExportCommandTest, UnreadableInput)
{
	EXPECT_EQ(Run({"-i", (dir / "missing.json").string(),
		       "-o", (dir / "out").string()}), 1);
}

TEST_F(ExportCommandTest, TrailingGarbageInInput)
{
	WriteInput(std::string(road_trip_json) + " garbage");
	EXPECT_EQ(Run({"-i", input.string(), "-o", (dir / "out").string()}), 1);
}

TEST_F(ExportCommandTest, OptionValueIsNotAFlag)
{
	/* "-h" is the output directory here, so no help is printed and
	   the missing --input is reported */
	EXPECT_EQ(Run({"-o", "-h"}), 1);
}

TEST_F(ExportCommandTest, OptionWithoutValue)
{
	EXPECT_EQ(Run({"-i", input.string(), "-f"}), 1);
	EXPECT_EQ(Run({"-i"}), 1);
}

TEST_F(ExportCommandTest, UnexpectedArgument)
{
	EXPECT_EQ(Run({"-i", input.string(), "--verbose"}), 1);
	EXPECT_EQ(Run({input.string()}), 1);
}
