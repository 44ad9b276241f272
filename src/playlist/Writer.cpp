#include "playlist/Writer.hpp"

#include <fstream>
#include <stdexcept>

namespace playlist {

void write_document(const std::filesystem::path& out_path, const std::string& content) {
    std::ofstream out(out_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << content;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write output file: " + out_path.string());
}

}  // namespace playlist
