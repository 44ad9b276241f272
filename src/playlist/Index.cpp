#include "playlist/Index.hpp"

#include <algorithm>

namespace playlist {

std::size_t count_tracks(const Collection& c) {
    std::size_t n = 0;
    for (const auto& p : c.playlists) n += p.items.size();
    return n;
}

std::vector<IndexEntry> pair_with_filenames(const Collection& c, const std::vector<std::string>& filenames) {
    const std::size_t n = std::min(c.playlists.size(), filenames.size());

    std::vector<IndexEntry> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(IndexEntry{&c.playlists[i], filenames[i]});
    }
    return out;
}

IndexSummary summarize(const std::vector<IndexEntry>& entries) {
    IndexSummary s;
    for (const auto& e : entries) {
        if (!e.playlist) continue;
        ++s.total_playlists;
        s.total_tracks += e.playlist->items.size();
    }
    s.entries = entries;
    return s;
}

IndexSummary summarize(const Collection& c, const std::vector<std::string>& filenames) {
    IndexSummary s;
    s.total_playlists = c.playlists.size();
    s.total_tracks = count_tracks(c);
    s.entries = pair_with_filenames(c, filenames);
    return s;
}

}  // namespace playlist
