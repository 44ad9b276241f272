#pragma once

#include <string>
#include <vector>

#include "playlist/Index.hpp"
#include "playlist/Models.hpp"

namespace playlist {

// Self-contained page for one playlist. All user text is HTML-escaped
// except the track URI, which goes into href as is.
std::string render_playlist_html(const Playlist& p);

// Stat cards for the totals followed by one card per entry.
std::string render_index_html(const IndexSummary& summary);

std::string render_index_html(const std::vector<IndexEntry>& entries);

std::string render_index_html(const Collection& c, const std::vector<std::string>& filenames);

}  // namespace playlist
