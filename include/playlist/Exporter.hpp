#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "playlist/Models.hpp"
#include "playlist/OutputFormat.hpp"

namespace playlist {

struct ExportOptions {
    std::string input;
    std::filesystem::path output = "output";
    OutputFormat format = OutputFormat::Markdown;
};

struct ExportResult {
    std::vector<std::string> playlist_files;   // one per playlist, input order
    std::filesystem::path index_path;
};

// Render one document in the requested format.
std::string render_playlist(const Playlist& p, OutputFormat format);

// Creates the output directory, writes one file per playlist and then the
// index. Progress lines go to `log`; duplicate file names go to `warn`.
// Throws std::runtime_error on the first I/O failure. Files already written
// are left in place.
ExportResult export_collection(const Collection& c,
                               const std::filesystem::path& outdir,
                               OutputFormat format,
                               std::ostream& log,
                               std::ostream& warn);

}  // namespace playlist
