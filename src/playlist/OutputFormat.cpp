#include "playlist/OutputFormat.hpp"

#include <cctype>

namespace playlist {

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::optional<OutputFormat> parse_output_format(const std::string& s) {
    const std::string lower = to_lower_copy(s);
    if (lower == "markdown") return OutputFormat::Markdown;
    if (lower == "html") return OutputFormat::Html;
    return std::nullopt;
}

const char* format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Markdown: return "markdown";
        case OutputFormat::Html: return "html";
    }
    return "markdown";
}

const char* file_extension(OutputFormat f) {
    switch (f) {
        case OutputFormat::Markdown: return "md";
        case OutputFormat::Html: return "html";
    }
    return "md";
}

std::string index_filename(OutputFormat f) {
    return std::string("index.") + file_extension(f);
}

}  // namespace playlist
