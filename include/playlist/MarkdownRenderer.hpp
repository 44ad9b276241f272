#pragma once

#include <string>
#include <vector>

#include "playlist/Index.hpp"
#include "playlist/Models.hpp"

namespace playlist {

// Full standalone page for one playlist. Track/artist/album cells are
// escaped for table syntax; everything else is inserted verbatim.
std::string render_playlist_markdown(const Playlist& p);

std::string render_index_markdown(const IndexSummary& summary);

std::string render_index_markdown(const std::vector<IndexEntry>& entries);

std::string render_index_markdown(const Collection& c, const std::vector<std::string>& filenames);

}  // namespace playlist
