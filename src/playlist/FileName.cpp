#include "playlist/FileName.hpp"

#include <cctype>

namespace playlist {

static bool is_reserved(char c) {
    switch (c) {
        case '/': case '\\': case ':': case '*': case '?':
        case '"': case '<': case '>': case '|':
            return true;
        default:
            return false;
    }
}

// Byte length of the Unicode White_Space code point starting at s[i],
// or 0. Covers the ASCII set plus U+0085, U+00A0, U+1680, U+2000-U+200A,
// U+2028, U+2029, U+202F, U+205F and U+3000 in UTF-8.
static std::size_t space_at(const std::string& s, std::size_t i) {
    const auto byte = [&](std::size_t k) {
        return static_cast<unsigned char>(s[k]);
    };
    const std::size_t left = s.size() - i;

    const unsigned char b0 = byte(i);
    if (b0 < 0x80) return std::isspace(b0) ? 1 : 0;
    if (left < 2) return 0;

    const unsigned char b1 = byte(i + 1);
    if (b0 == 0xC2) return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
    if (left < 3) return 0;

    const unsigned char b2 = byte(i + 2);
    if (b0 == 0xE1) return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    if (b0 == 0xE3) return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    if (b0 == 0xE2 && b1 == 0x80) {
        const bool space = (b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF;
        return space ? 3 : 0;
    }
    if (b0 == 0xE2 && b1 == 0x81) return b2 == 0x9F ? 3 : 0;
    return 0;
}

static std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size()) {
        const std::size_t n = space_at(s, a);
        if (n == 0) break;
        a += n;
    }

    size_t b = s.size();
    while (b > a) {
        std::size_t n = 0;
        for (std::size_t len = 1; len <= 3 && len <= b - a; ++len) {
            if (space_at(s, b - len) == len) {
                n = len;
                break;
            }
        }
        if (n == 0) break;
        b -= n;
    }

    return s.substr(a, b - a);
}

std::string sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        out += is_reserved(c) ? '-' : c;
    }
    return trim_copy(out);
}

std::string playlist_filename(const std::string& name, const std::string& extension) {
    return sanitize_filename(name) + "." + extension;
}

}  // namespace playlist
