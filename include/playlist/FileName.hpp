#pragma once
#include <string>

namespace playlist {

// Replace / \ : * ? " < > | with '-' and trim surrounding Unicode
// whitespace (UTF-8). Everything else passes through untouched.
// No uniqueness or length handling.
std::string sanitize_filename(const std::string& name);

// sanitize_filename(name) + "." + extension
std::string playlist_filename(const std::string& name, const std::string& extension);

}  // namespace playlist
