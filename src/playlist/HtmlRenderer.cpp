#include "playlist/HtmlRenderer.hpp"

#include "playlist/Escape.hpp"
#include "playlist/Styles.hpp"

namespace playlist {

static const char* const kPlaylistStyles =
    "        .metadata {\n"
    "            background-color: #f9f9f9;\n"
    "            padding: 15px;\n"
    "            border-radius: 5px;\n"
    "            margin-bottom: 30px;\n"
    "        }\n"
    "        .metadata p {\n"
    "            margin: 5px 0;\n"
    "        }\n"
    "        table {\n"
    "            width: 100%;\n"
    "            border-collapse: collapse;\n"
    "        }\n"
    "        th {\n"
    "            background-color: #1db954;\n"
    "            color: white;\n"
    "            padding: 12px;\n"
    "            text-align: left;\n"
    "        }\n"
    "        td {\n"
    "            padding: 12px;\n"
    "            border-bottom: 1px solid #ddd;\n"
    "        }\n"
    "        tr:hover {\n"
    "            background-color: #f5f5f5;\n"
    "        }\n"
    "        .track-number {\n"
    "            color: #999;\n"
    "            text-align: center;\n"
    "            width: 50px;\n"
    "        }\n";

static const char* const kIndexStyles =
    "        .stats {\n"
    "            display: flex;\n"
    "            gap: 30px;\n"
    "            margin-bottom: 30px;\n"
    "        }\n"
    "        .stat-card {\n"
    "            background-color: #f9f9f9;\n"
    "            padding: 20px;\n"
    "            border-radius: 8px;\n"
    "            flex: 1;\n"
    "        }\n"
    "        .stat-card h3 {\n"
    "            margin: 0 0 10px 0;\n"
    "            color: #666;\n"
    "            font-size: 14px;\n"
    "            text-transform: uppercase;\n"
    "        }\n"
    "        .stat-card p {\n"
    "            margin: 0;\n"
    "            font-size: 32px;\n"
    "            font-weight: bold;\n"
    "            color: #1db954;\n"
    "        }\n"
    "        .playlist-grid {\n"
    "            display: grid;\n"
    "            grid-template-columns: repeat(auto-fill, minmax(300px, 1fr));\n"
    "            gap: 20px;\n"
    "        }\n"
    "        .playlist-card {\n"
    "            background-color: #f9f9f9;\n"
    "            padding: 20px;\n"
    "            border-radius: 8px;\n"
    "            transition: transform 0.2s, box-shadow 0.2s;\n"
    "        }\n"
    "        .playlist-card:hover {\n"
    "            transform: translateY(-2px);\n"
    "            box-shadow: 0 4px 12px rgba(0,0,0,0.15);\n"
    "        }\n"
    "        .playlist-card h3 {\n"
    "            margin: 0 0 10px 0;\n"
    "            color: #333;\n"
    "        }\n"
    "        .playlist-card h3 a {\n"
    "            color: #333;\n"
    "        }\n"
    "        .playlist-meta {\n"
    "            color: #666;\n"
    "            font-size: 14px;\n"
    "        }\n";

static const char* const kBackToIndex =
    "        <a href=\"index.html\" class=\"nav-link\">← Back to Index</a>\n";

// <!DOCTYPE> through <body>, title already escaped by the caller.
static std::string page_head(const std::string& escaped_title, const char* page_styles) {
    std::string html;
    html += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n";
    html += "    <meta charset=\"UTF-8\">\n";
    html += "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n";
    html += "    <title>" + escaped_title + "</title>\n";
    html += "    <style>\n";
    html += kCommonStyles;
    html += page_styles;
    html += "    </style>\n";
    html += "</head>\n<body>\n";
    return html;
}

static std::string td(const std::string& content) {
    return "                    <td>" + content + "</td>\n";
}

static void render_track_table(std::string& html, const std::vector<Item>& items) {
    html += "        <h2>Tracks</h2>\n";
    html += "        <table>\n";
    html += "            <thead>\n";
    html += "                <tr>\n";
    html += "                    <th class=\"track-number\">#</th>\n";
    html += "                    <th>Track Name</th>\n";
    html += "                    <th>Artist</th>\n";
    html += "                    <th>Album</th>\n";
    html += "                    <th>Added Date</th>\n";
    html += "                </tr>\n";
    html += "            </thead>\n";
    html += "            <tbody>\n";

    for (std::size_t i = 0; i < items.size(); ++i) {
        const Item& item = items[i];
        const Track& t = item.track;

        html += "                <tr>\n";
        html += "                    <td class=\"track-number\">" + std::to_string(i + 1) + "</td>\n";
        // TODO: escape track_uri once downstream consumers accept the changed href bytes.
        html += td("<a href=\"" + t.track_uri + "\">" + html_escape(t.track_name) + "</a>");
        html += td(html_escape(t.artist_name));
        html += td(html_escape(t.album_name));
        html += td(html_escape(item.added_date));
        html += "                </tr>\n";
    }

    html += "            </tbody>\n";
    html += "        </table>\n";
}

std::string render_playlist_html(const Playlist& p) {
    const std::string title = html_escape(p.name);

    std::string html = page_head(title, kPlaylistStyles);
    html += "    <div class=\"container\">\n";
    html += kBackToIndex;
    html += "        <h1>" + title + "</h1>\n";

    html += "        <div class=\"metadata\">\n";
    html += "            <p><strong>Last Modified:</strong> " + html_escape(p.last_modified_date) + "</p>\n";
    html += "            <p><strong>Followers:</strong> " + std::to_string(p.number_of_followers) + "</p>\n";
    html += "            <p><strong>Total Tracks:</strong> " + std::to_string(p.items.size()) + "</p>\n";
    html += "        </div>\n";

    if (!p.items.empty()) render_track_table(html, p.items);

    html += kBackToIndex;
    html += "    </div>\n";

    // floating, fixed to the viewport corner
    html += "    <a href=\"#\" class=\"back-to-top\">↑ Top</a>\n";
    html += "</body>\n</html>";
    return html;
}

std::string render_index_html(const IndexSummary& summary) {
    std::string html = page_head("My Spotify Playlists", kIndexStyles);
    html += "    <div class=\"container\">\n";
    html += "        <h1>My Spotify Playlists</h1>\n";

    html += "        <div class=\"stats\">\n";
    html += "            <div class=\"stat-card\">\n";
    html += "                <h3>Total Playlists</h3>\n";
    html += "                <p>" + std::to_string(summary.total_playlists) + "</p>\n";
    html += "            </div>\n";
    html += "            <div class=\"stat-card\">\n";
    html += "                <h3>Total Tracks</h3>\n";
    html += "                <p>" + std::to_string(summary.total_tracks) + "</p>\n";
    html += "            </div>\n";
    html += "        </div>\n";

    html += "        <h2>Playlists</h2>\n";
    html += "        <div class=\"playlist-grid\">\n";
    for (const auto& e : summary.entries) {
        if (!e.playlist) continue;
        const Playlist& p = *e.playlist;

        html += "            <div class=\"playlist-card\">\n";
        html += "                <h3><a href=\"" + html_escape(e.filename) + "\">" + html_escape(p.name) + "</a></h3>\n";
        html += "                <div class=\"playlist-meta\">\n";
        html += "                    " + std::to_string(p.items.size()) + " tracks<br>\n";
        html += "                    " + std::to_string(p.number_of_followers) + " followers\n";
        html += "                </div>\n";
        html += "            </div>\n";
    }
    html += "        </div>\n";

    html += "    </div>\n";
    html += "</body>\n</html>";
    return html;
}

std::string render_index_html(const std::vector<IndexEntry>& entries) {
    return render_index_html(summarize(entries));
}

std::string render_index_html(const Collection& c, const std::vector<std::string>& filenames) {
    return render_index_html(summarize(c, filenames));
}

}  // namespace playlist
