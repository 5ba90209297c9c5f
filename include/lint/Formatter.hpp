#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lint/ValidationTypes.hpp"
#include "schema/Registry.hpp"

namespace lint {

struct SummaryStats {
    size_t total_files = 0;
    size_t valid_files = 0;
    size_t total_errors = 0;
    size_t total_warnings = 0;
    std::map<std::string, size_t> findings_by_kind;  // errors and warnings
    std::map<std::string, size_t> findings_by_rule;
};

SummaryStats summary_stats(const std::vector<ValidationResult>& results);

// Errors are always listed for invalid files; warnings when verbose or when a
// file has no errors.
std::string format_text(const std::vector<ValidationResult>& results, bool verbose, bool show_suggestions = true);
std::string format_summary(const std::vector<ValidationResult>& results);

nlohmann::json results_to_json(const std::vector<ValidationResult>& results);
std::string format_json(const std::vector<ValidationResult>& results);

std::string format_junit(const std::vector<ValidationResult>& results);

std::string format_document_types(const std::vector<schema::DocumentTypeDefinition>& types);

}  // namespace lint
