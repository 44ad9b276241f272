#pragma once
#include <string>

namespace playlist {

// & < > " ' -> entities. Nothing is escaped twice.
std::string html_escape(const std::string& s);

// Backslash before | [ ] so table cells and link text stay intact.
std::string markdown_escape(const std::string& s);

}  // namespace playlist
