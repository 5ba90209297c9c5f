#include "commands/check.hpp"
#include "commands/common.hpp"

#include "lint/Formatter.hpp"
#include "lint/Linter.hpp"
#include "schema/SchemaLoader.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int check_usage() {
    std::cerr
        << "usage:\n"
        << "  planlint check <file> [--schema-path <dir>] [--config <path>]\n";
    return 2;
}

int cmd_check(int argc, char** argv) {
    const auto args = cmdutil::positional_args(argc, argv);
    if (args.size() != 1) {
        std::cerr << "error: expected exactly one file\n";
        return check_usage();
    }

    lint::LinterConfig cfg;
    try {
        cfg = cmdutil::load_effective_config(argc, argv);
    } catch (const std::exception& e) {
        cmdutil::print_error(e);
        return 2;
    }

    schema::SchemaLoader loader(cfg.schema_path);
    try {
        loader.load();
    } catch (const std::exception& e) {
        cmdutil::print_error(e, "failed to load schemas");
        return 2;
    }

    const lint::Linter linter(cfg, loader);
    const lint::ValidationResult result = linter.lint_file(fs::path(args[0]));

    std::cout << lint::format_text({result}, true, cfg.output.show_suggestions);
    return result.valid ? 0 : 1;
}
