#include "commands/common.hpp"

#include "core/Errors.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cmdutil {

static const std::set<std::string>& value_options() {
    static const std::set<std::string> opts = {
        "--schema-path", "--config", "--format", "-f", "--output", "-o",
        "--exclude", "--jobs", "--title", "--author",
    };
    return opts;
}

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

std::vector<std::string> positional_args(int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (value_options().count(a)) {
            ++i;
            continue;
        }
        if (!a.empty() && a[0] == '-') continue;
        out.push_back(a);
    }
    return out;
}

static std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

lint::LinterConfig load_effective_config(int argc, char** argv) {
    std::optional<fs::path> config_path;
    const std::string cli_config = get_arg(argc, argv, "--config", "");
    if (!cli_config.empty()) {
        config_path = cli_config;
    } else if (auto e = env("PLANLINT_CONFIG")) {
        config_path = *e;
    }

    lint::LinterConfig cfg = lint::load_config(config_path);

    if (auto e = env("PLANLINT_SCHEMA_PATH")) cfg.schema_path = *e;

    const std::string schema_path = get_arg(argc, argv, "--schema-path", "");
    if (!schema_path.empty()) cfg.schema_path = schema_path;

    if (has_flag(argc, argv, "--verbose") || has_flag(argc, argv, "-v")) cfg.output.verbose = true;

    const std::string jobs = get_arg(argc, argv, "--jobs", "");
    if (!jobs.empty()) {
        int n = 0;
        try {
            n = std::stoi(jobs);
        } catch (const std::exception&) {
            throw std::runtime_error("--jobs expects a number, got: " + jobs);
        }
        if (n < 0) throw std::runtime_error("--jobs must not be negative");
        cfg.jobs = n;
    }

    return lint::resolve_paths(std::move(cfg));
}

void print_error(const std::exception& e, const std::string& context) {
    std::cerr << "error: ";
    if (!context.empty()) std::cerr << context << ": ";
    std::cerr << e.what() << "\n";

    if (const auto* err = dynamic_cast<const core::Error*>(&e)) {
        if (const char* hint = core::error_hint(err->kind())) std::cerr << "hint: " << hint << "\n";
    }
}

}  // namespace cmdutil
