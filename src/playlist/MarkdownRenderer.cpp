#include "playlist/MarkdownRenderer.hpp"

#include "playlist/Escape.hpp"

namespace playlist {

static const char* const kBackToIndex = "[← Back to Index](index.md)\n";

static std::string track_row(std::size_t number, const Item& item) {
    const Track& t = item.track;

    std::string row = "| " + std::to_string(number) + " | ";
    row += "[" + markdown_escape(t.track_name) + "](" + t.track_uri + ") | ";
    row += markdown_escape(t.artist_name) + " | ";
    row += markdown_escape(t.album_name) + " | ";
    row += item.added_date + " |\n";
    return row;
}

std::string render_playlist_markdown(const Playlist& p) {
    std::string out;

    out += "# " + p.name + "\n\n";
    out += kBackToIndex;
    out += "\n";

    out += "## Playlist Information\n\n";
    out += "- **Last Modified:** " + p.last_modified_date + "\n";
    out += "- **Followers:** " + std::to_string(p.number_of_followers) + "\n";
    out += "- **Total Tracks:** " + std::to_string(p.items.size()) + "\n\n";

    if (!p.items.empty()) {
        out += "## Tracks\n\n";
        out += "| # | Track Name | Artist | Album | Added Date |\n";
        out += "|---|------------|--------|-------|------------|\n";
        for (std::size_t i = 0; i < p.items.size(); ++i) {
            out += track_row(i + 1, p.items[i]);
        }
    }

    out += "\n[↑ Back to Top](#)\n\n";
    out += kBackToIndex;

    return out;
}

std::string render_index_markdown(const IndexSummary& summary) {
    std::string out;

    out += "# My Spotify Playlists\n\n";
    out += "**Total Playlists:** " + std::to_string(summary.total_playlists) + "\n\n";
    out += "**Total Tracks:** " + std::to_string(summary.total_tracks) + "\n\n";

    out += "## Playlists\n\n";
    for (const auto& e : summary.entries) {
        if (!e.playlist) continue;
        const Playlist& p = *e.playlist;
        out += "- [**" + p.name + "**](" + e.filename + ") - ";
        out += std::to_string(p.items.size()) + " tracks, ";
        out += std::to_string(p.number_of_followers) + " followers\n";
    }

    return out;
}

std::string render_index_markdown(const std::vector<IndexEntry>& entries) {
    return render_index_markdown(summarize(entries));
}

std::string render_index_markdown(const Collection& c, const std::vector<std::string>& filenames) {
    return render_index_markdown(summarize(c, filenames));
}

}  // namespace playlist
