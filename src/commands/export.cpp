#include "commands/export.hpp"

#include "io/JsonIO.hpp"
#include "playlist/Exporter.hpp"
#include "playlist/Models.hpp"
#include "playlist/OutputFormat.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#ifndef PLAYLIST_DOCS_VERSION
#define PLAYLIST_DOCS_VERSION "0.1.0"
#endif

struct ExportArgs {
    std::string input;
    std::string output = "output";
    std::string format = "markdown";
    bool help = false;
    bool version = false;
    std::string error;               // non-empty on a usage error
};

static bool is_opt(const std::string& a, const char* key, const char* alias) {
    return a == key || a == alias;
}

// Value-taking options consume the next argument, so "-o -h" names an
// output directory called "-h".
static ExportArgs parse_args(int argc, char** argv) {
    ExportArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (is_opt(a, "--help", "-h")) {
            args.help = true;
            continue;
        }
        if (is_opt(a, "--version", "-V")) {
            args.version = true;
            continue;
        }

        std::string* target = nullptr;
        if (is_opt(a, "--input", "-i")) target = &args.input;
        else if (is_opt(a, "--output", "-o")) target = &args.output;
        else if (is_opt(a, "--format", "-f")) target = &args.format;

        if (!target) {
            args.error = "unexpected argument '" + a + "'";
            return args;
        }
        if (i + 1 >= argc) {
            args.error = "missing value for " + a;
            return args;
        }
        *target = argv[++i];
    }
    return args;
}

int print_export_help() {
    std::cerr
        << "Convert Spotify playlists JSON to Markdown or HTML files\n"
        << "\n"
        << "usage:\n"
        << "  playlist-docs --input <file> [options]\n"
        << "\n"
        << "options:\n"
        << "  -i, --input <path>           input JSON file (required)\n"
        << "  -o, --output <dir>           default: output\n"
        << "  -f, --format <fmt>           markdown | html, default: markdown\n"
        << "  -h, --help                   print this help\n"
        << "  -V, --version                print version\n";
    return 0;
}

int cmd_export(int argc, char** argv) {
    const ExportArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n\n";
        print_export_help();
        return 1;
    }
    if (args.help) return print_export_help();
    if (args.version) {
        std::cout << "playlist-docs " << PLAYLIST_DOCS_VERSION << "\n";
        return 0;
    }

    if (args.input.empty()) {
        std::cerr << "Error: missing required argument --input\n\n";
        print_export_help();
        return 1;
    }

    const std::optional<playlist::OutputFormat> format = playlist::parse_output_format(args.format);
    if (!format) {
        std::cerr << "Error: format must be either 'markdown' or 'html'\n";
        return 1;
    }

    playlist::ExportOptions opts;
    opts.input = args.input;
    opts.output = args.output;
    opts.format = *format;

    playlist::Collection collection;
    try {
        std::cout << "Reading JSON file: " << opts.input << "\n";
        collection = loadCollection(opts.input);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load playlists: " << e.what() << "\n";
        return 1;
    }

    playlist::ExportResult result;
    try {
        result = playlist::export_collection(collection, opts.output, opts.format, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "[error] export failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nDone! Generated " << result.playlist_files.size() << " "
              << playlist::format_name(opts.format) << " files plus index.\n";
    std::cout << "Open " << result.index_path.string() << " to get started!\n";
    return 0;
}
