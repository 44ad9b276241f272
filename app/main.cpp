#include "commands/export.hpp"

int main(int argc, char** argv) {
    return cmd_export(argc, argv);
}
