#include "commands/check.hpp"
#include "commands/config.hpp"
#include "commands/create.hpp"
#include "commands/init.hpp"
#include "commands/lint.hpp"
#include "commands/list_types.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  planlint lint [patterns...] [options]\n"
        << "  planlint check <file>\n"
        << "  planlint list-types\n"
        << "  planlint create <type> <id> [--title <str>] [--author <str>] [--output <path>]\n"
        << "  planlint init\n"
        << "  planlint config [--show]\n"
        << "  planlint help\n"
        << "\n"
        << "global options:\n"
        << "  --schema-path <dir>          default: schema (env PLANLINT_SCHEMA_PATH)\n"
        << "  --config <path>              default: .planlint.json, planlint.json (env PLANLINT_CONFIG)\n"
        << "  --verbose, -v\n";
    return 2;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "lint")       return cmd_lint(argc - 1, argv + 1);
    if (cmd == "check")      return cmd_check(argc - 1, argv + 1);
    if (cmd == "list-types") return cmd_list_types(argc - 1, argv + 1);
    if (cmd == "create")     return cmd_create(argc - 1, argv + 1);
    if (cmd == "init")       return cmd_init(argc - 1, argv + 1);
    if (cmd == "config")     return cmd_config(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
