#include "commands/lint.hpp"
#include "commands/common.hpp"

#include "doc/TextUtil.hpp"
#include "io/JsonIO.hpp"
#include "lint/Formatter.hpp"
#include "lint/Linter.hpp"
#include "schema/SchemaLoader.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using cmdutil::get_arg;
using cmdutil::has_flag;

static int lint_usage() {
    std::cerr
        << "usage:\n"
        << "  planlint lint [patterns...] [options]\n"
        << "\n"
        << "options:\n"
        << "  --format <text|json|junit>   default: text (or config output.format)\n"
        << "  --output <path>              write the report to a file instead of stdout\n"
        << "  --exclude <a,b,...>          extra exclude globs\n"
        << "  --no-check-ids               skip duplicate id detection\n"
        << "  --no-check-refs              skip internal reference resolution\n"
        << "  --fail-on-warnings           exit 1 when any warning is reported\n"
        << "  --jobs <n>                   worker threads (0 = all cores)\n";
    return 2;
}

int cmd_lint(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) {
        lint_usage();
        return 0;
    }

    lint::LinterConfig cfg;
    try {
        cfg = cmdutil::load_effective_config(argc, argv);
    } catch (const std::exception& e) {
        cmdutil::print_error(e);
        return 2;
    }

    for (const auto& p : textutil::split_list(get_arg(argc, argv, "--exclude", ""), ',')) {
        cfg.exclude_patterns.push_back(p);
    }
    if (has_flag(argc, argv, "--no-check-ids")) cfg.rules.check_id_uniqueness = false;
    if (has_flag(argc, argv, "--no-check-refs")) cfg.rules.validate_references = false;

    std::string format = get_arg(argc, argv, "--format", get_arg(argc, argv, "-f", cfg.output.format));
    if (format != "text" && format != "json" && format != "junit") {
        std::cerr << "error: unknown format: " << format << "\n";
        return lint_usage();
    }
    std::string out_path = get_arg(argc, argv, "--output", get_arg(argc, argv, "-o", ""));
    const bool fail_on_warnings = has_flag(argc, argv, "--fail-on-warnings");

    std::vector<std::string> patterns = cmdutil::positional_args(argc, argv);
    if (patterns.empty()) patterns.push_back("**/*.adoc");

    schema::SchemaLoader loader(cfg.schema_path);
    try {
        loader.load();
    } catch (const std::exception& e) {
        cmdutil::print_error(e, "failed to load schemas");
        return 2;
    }
    if (cfg.output.verbose) std::cerr << "loaded " << loader.schema_count() << " schemas\n";

    const lint::Linter linter(cfg, loader);
    const auto files = linter.find_files(patterns);
    if (files.empty()) {
        std::cerr << "no markup files found matching: " << textutil::join(patterns, ", ") << "\n";
        return 0;
    }
    if (cfg.output.verbose) std::cerr << "found " << files.size() << " documents to validate\n";

    const auto results = linter.lint_files(files);

    std::string report;
    if (format == "json") {
        report = lint::format_json(results);
    } else if (format == "junit") {
        report = lint::format_junit(results);
    } else {
        report = lint::format_text(results, cfg.output.verbose, cfg.output.show_suggestions);
        report += lint::format_summary(results);
    }

    if (!out_path.empty()) {
        try {
            jsonio::write_text_file(fs::path(out_path), report);
        } catch (const std::exception& e) {
            cmdutil::print_error(e);
            return 2;
        }
        std::cout << "OUT_REPORT: " << out_path << "\n";
    } else {
        std::cout << report;
    }

    bool has_errors = false;
    bool has_warnings = false;
    for (const auto& r : results) {
        if (!r.valid) has_errors = true;
        if (!r.warnings.empty()) has_warnings = true;
    }
    return (has_errors || (fail_on_warnings && has_warnings)) ? 1 : 0;
}
