#pragma once

#include <optional>
#include <string>

namespace playlist {

enum class OutputFormat {
    Markdown,
    Html
};

// Case-insensitive; accepts exactly "markdown" or "html".
std::optional<OutputFormat> parse_output_format(const std::string& s);

const char* format_name(OutputFormat f);

// "md" or "html"
const char* file_extension(OutputFormat f);

// index.md / index.html
std::string index_filename(OutputFormat f);

}  // namespace playlist
