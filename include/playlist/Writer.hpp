#pragma once

#include <filesystem>
#include <string>

namespace playlist {

// Writes content byte for byte, replacing any existing file.
// Throws std::runtime_error if the file cannot be opened or written.
void write_document(const std::filesystem::path& out_path, const std::string& content);

}  // namespace playlist
