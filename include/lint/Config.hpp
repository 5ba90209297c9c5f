#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lint {

struct ValidationRules {
    bool validate_references = true;
    bool check_id_uniqueness = true;
};

struct OutputConfig {
    std::string format = "text";  // text | json | junit
    bool verbose = false;
    bool show_suggestions = true;
};

struct LinterConfig {
    std::filesystem::path schema_path = "schema";
    std::vector<std::string> exclude_patterns = {
        "node_modules/**",
        "target/**",
        "dist/**",
        ".git/**",
        "*.tmp.adoc",
    };
    ValidationRules rules;
    OutputConfig output;
    int jobs = 0;  // worker threads, 0 = hardware concurrency
};

// Searched in order when no explicit path is given.
const std::vector<std::string>& default_config_files();

// Explicit path must exist (core::ConfigError otherwise). Without one, the first
// existing default file is used; with none, defaults are returned.
LinterConfig load_config(const std::optional<std::filesystem::path>& explicit_path);

// Unknown keys are ignored; a wrong-typed key throws core::ConfigError.
LinterConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const LinterConfig& cfg);

// Relative schema_path is anchored at base (current directory when empty).
LinterConfig resolve_paths(LinterConfig cfg, const std::filesystem::path& base = {});

}  // namespace lint
