#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "playlist/Models.hpp"

// Build a Collection from an already parsed document.
// Throws std::runtime_error naming the offending JSON path on schema mismatch.
playlist::Collection parseCollection(const nlohmann::json& root);

// Read and parse a playlists export from disk.
playlist::Collection loadCollection(const std::string& path);
