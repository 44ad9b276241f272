#pragma once

// playlist-docs --input <file> [--output <dir>] [--format markdown|html]
//               [--help] [--version]
// argv[0] is the program name. Returns the process exit status: 0 on
// success or after --help/--version, 1 on a usage, load or write error.
int cmd_export(int argc, char** argv);

int print_export_help();
