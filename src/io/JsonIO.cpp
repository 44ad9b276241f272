#include "io/JsonIO.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using playlist::Collection;
using playlist::Item;
using playlist::Playlist;
using playlist::Track;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static std::int64_t require_integer(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    const bool out_of_range = v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (!v.is_number_integer() || out_of_range) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return v.get<std::int64_t>();
}

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

static Track parseTrack(const json& j, const std::string& where) {
    require_object(j, where);

    Track t;
    t.track_name  = require_string(j, "trackName", where);
    t.artist_name = require_string(j, "artistName", where);
    t.album_name  = require_string(j, "albumName", where);
    t.track_uri   = require_string(j, "trackUri", where);
    return t;
}

static Item parseItem(const json& j, const std::string& where) {
    require_object(j, where);

    Item it;
    it.track       = parseTrack(require_field(j, "track", where), where + ".track");
    it.episode     = require_field(j, "episode", where);
    it.audiobook   = require_field(j, "audiobook", where);
    it.local_track = require_field(j, "localTrack", where);
    it.added_date  = require_string(j, "addedDate", where);
    return it;
}

static Playlist parsePlaylist(const json& j, const std::string& where) {
    require_object(j, where);

    Playlist p;
    p.name               = require_string(j, "name", where);
    p.last_modified_date = require_string(j, "lastModifiedDate", where);

    p.collaborators = require_field(j, "collaborators", where);
    require_array(p.collaborators, where + ".collaborators");

    const json& items = require_field(j, "items", where);
    require_array(items, where + ".items");
    p.items.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        p.items.push_back(parseItem(items.at(i), index_path(where, "items", i)));
    }

    p.description         = require_field(j, "description", where);
    p.number_of_followers = require_integer(j, "numberOfFollowers", where);
    return p;
}

Collection parseCollection(const json& root) {
    require_object(root, "root");

    const json& playlists = require_field(root, "playlists", "root");
    require_array(playlists, "root.playlists");

    Collection c;
    c.playlists.reserve(playlists.size());
    for (size_t i = 0; i < playlists.size(); ++i) {
        c.playlists.push_back(parsePlaylist(playlists.at(i), index_path("root", "playlists", i)));
    }
    return c;
}

Collection loadCollection(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open playlists file: " + path);
    }

    // json::parse is strict: trailing text after the document is an error
    json j;
    try {
        j = json::parse(in);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return parseCollection(j);
}
