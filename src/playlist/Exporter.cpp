#include "playlist/Exporter.hpp"

#include "playlist/FileName.hpp"
#include "playlist/HtmlRenderer.hpp"
#include "playlist/Index.hpp"
#include "playlist/MarkdownRenderer.hpp"
#include "playlist/Writer.hpp"

#include <stdexcept>
#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

namespace playlist {

// An empty path is the current directory.
static void ensure_directory(const fs::path& dir) {
    if (dir.empty()) return;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory: " + dir.string() + " (" + ec.message() + ")");
    }
}

std::string render_playlist(const Playlist& p, OutputFormat format) {
    if (format == OutputFormat::Html) return render_playlist_html(p);
    return render_playlist_markdown(p);
}

static std::string render_index(const IndexSummary& summary, OutputFormat format) {
    if (format == OutputFormat::Html) return render_index_html(summary);
    return render_index_markdown(summary);
}

ExportResult export_collection(const Collection& c,
                               const fs::path& outdir,
                               OutputFormat format,
                               std::ostream& log,
                               std::ostream& warn) {
    ensure_directory(outdir);
    log << "Output directory: " << outdir.string() << "\n";
    log << "Output format: " << format_name(format) << "\n";

    const std::string ext = file_extension(format);

    ExportResult result;
    result.playlist_files.reserve(c.playlists.size());

    // file name -> name of the playlist that last wrote it
    std::unordered_map<std::string, std::string> written;
    written.reserve(c.playlists.size() * 2 + 8);

    log << "\nProcessing " << c.playlists.size() << " playlists...\n";
    for (const auto& p : c.playlists) {
        const std::string filename = playlist_filename(p.name, ext);

        auto it = written.find(filename);
        if (it != written.end()) {
            warn << "[warn] " << filename << ": playlist \"" << p.name
                 << "\" overwrites playlist \"" << it->second << "\"\n";
            it->second = p.name;
        } else {
            written.emplace(filename, p.name);
        }

        write_document(outdir / filename, render_playlist(p, format));
        result.playlist_files.push_back(filename);

        log << "  ✓ Created: " << filename << " (" << p.items.size() << " tracks)\n";
    }

    const std::string index_name = index_filename(format);
    result.index_path = outdir / index_name;

    const IndexSummary summary = summarize(c, result.playlist_files);
    write_document(result.index_path, render_index(summary, format));
    log << "\n  ✓ Created: " << index_name << "\n";

    return result;
}

}  // namespace playlist
