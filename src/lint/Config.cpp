#include "lint/Config.hpp"

#include "core/Errors.hpp"
#include "io/JsonIO.hpp"

#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace lint {

const std::vector<std::string>& default_config_files() {
    static const std::vector<std::string> files = {".planlint.json", "planlint.json"};
    return files;
}

static LinterConfig parse_config(const json& j) {
    jsonio::require_object(j, "config");

    LinterConfig cfg;

    if (auto v = jsonio::optional_string(j, "schema_path", "config")) cfg.schema_path = *v;
    if (auto v = jsonio::optional_string_array(j, "exclude_patterns", "config")) cfg.exclude_patterns = *v;
    if (auto v = jsonio::optional_int(j, "jobs", "config")) {
        if (*v < 0) throw std::runtime_error("config.jobs must not be negative");
        cfg.jobs = *v;
    }

    if (j.contains("rules")) {
        const json& r = j.at("rules");
        jsonio::require_object(r, "config.rules");
        if (auto v = jsonio::optional_bool(r, "validate_references", "config.rules")) cfg.rules.validate_references = *v;
        if (auto v = jsonio::optional_bool(r, "check_id_uniqueness", "config.rules")) cfg.rules.check_id_uniqueness = *v;
    }

    if (j.contains("output")) {
        const json& o = j.at("output");
        jsonio::require_object(o, "config.output");
        if (auto v = jsonio::optional_string(o, "format", "config.output")) {
            if (*v != "text" && *v != "json" && *v != "junit") {
                throw std::runtime_error("config.output.format must be one of text, json, junit");
            }
            cfg.output.format = *v;
        }
        if (auto v = jsonio::optional_bool(o, "verbose", "config.output")) cfg.output.verbose = *v;
        if (auto v = jsonio::optional_bool(o, "show_suggestions", "config.output")) cfg.output.show_suggestions = *v;
    }

    return cfg;
}

LinterConfig config_from_json(const json& j) {
    try {
        return parse_config(j);
    } catch (const std::exception& e) {
        throw core::ConfigError(e.what());
    }
}

json config_to_json(const LinterConfig& cfg) {
    json j;
    j["schema_path"] = cfg.schema_path.string();
    j["exclude_patterns"] = cfg.exclude_patterns;
    j["jobs"] = cfg.jobs;
    j["rules"] = {
        {"validate_references", cfg.rules.validate_references},
        {"check_id_uniqueness", cfg.rules.check_id_uniqueness}
    };
    j["output"] = {
        {"format", cfg.output.format},
        {"verbose", cfg.output.verbose},
        {"show_suggestions", cfg.output.show_suggestions}
    };
    return j;
}

LinterConfig load_config(const std::optional<fs::path>& explicit_path) {
    std::optional<fs::path> path;

    if (explicit_path) {
        if (!fs::exists(*explicit_path)) {
            throw core::ConfigError("config file not found: " + explicit_path->string());
        }
        path = *explicit_path;
    } else {
        for (const auto& candidate : default_config_files()) {
            if (fs::exists(candidate)) {
                path = fs::path(candidate);
                break;
            }
        }
    }

    if (!path) return LinterConfig{};

    json j;
    try {
        j = jsonio::read_json_file(*path);
    } catch (const std::exception& e) {
        throw core::ConfigError(e.what());
    }
    return config_from_json(j);
}

LinterConfig resolve_paths(LinterConfig cfg, const fs::path& base) {
    if (cfg.schema_path.is_relative()) {
        const fs::path root = base.empty() ? fs::current_path() : base;
        cfg.schema_path = root / cfg.schema_path;
    }
    return cfg;
}

}  // namespace lint
