#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace playlist {

struct Track {
    std::string track_name;
    std::string artist_name;
    std::string album_name;
    std::string track_uri;           // used verbatim as a link target
};

struct Item {
    Track track;
    nlohmann::json episode;          // carried, never rendered
    nlohmann::json audiobook;
    nlohmann::json local_track;
    std::string added_date;          // opaque, rendered verbatim
};

struct Playlist {
    std::string name;
    std::string last_modified_date;  // opaque, not parsed as a date
    nlohmann::json collaborators = nlohmann::json::array();
    std::vector<Item> items;
    nlohmann::json description;
    std::int64_t number_of_followers = 0;  // not validated, negatives pass through
};

struct Collection {
    std::vector<Playlist> playlists;
};

}  // namespace playlist
