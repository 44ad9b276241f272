#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "playlist/Models.hpp"

namespace playlist {

// One index line: a playlist and the file it was rendered to.
// The playlist is borrowed from the Collection, which outlives the entry.
struct IndexEntry {
    const Playlist* playlist = nullptr;
    std::string filename;
};

struct IndexSummary {
    std::size_t total_playlists = 0;
    std::size_t total_tracks = 0;
    std::vector<IndexEntry> entries;
};

std::size_t count_tracks(const Collection& c);

// Zip-shortest: a length mismatch is a caller error; extra items on either
// side are dropped.
std::vector<IndexEntry> pair_with_filenames(const Collection& c, const std::vector<std::string>& filenames);

// Totals taken from the entries themselves; entries without a playlist
// are not counted (the renderers skip them too).
IndexSummary summarize(const std::vector<IndexEntry>& entries);

// Totals taken from the whole collection, entries zipped as above.
IndexSummary summarize(const Collection& c, const std::vector<std::string>& filenames);

}  // namespace playlist
