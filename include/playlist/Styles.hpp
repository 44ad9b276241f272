#pragma once

namespace playlist {

// Style rules shared verbatim by every generated HTML page:
// body/container, accent color for headings and links, the floating
// .back-to-top button and the .nav-link chip.
extern const char* const kCommonStyles;

}  // namespace playlist
