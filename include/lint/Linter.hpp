#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "lint/Config.hpp"
#include "lint/ValidationTypes.hpp"
#include "schema/SchemaLoader.hpp"

namespace lint {

// Batch pipeline over a set of files sharing one DocumentIndex.
class Linter {
public:
    // The loader must already be loaded and must outlive the linter.
    Linter(LinterConfig cfg, const schema::SchemaLoader& schemas);

    std::vector<std::filesystem::path> find_files(const std::vector<std::string>& patterns) const;

    // Phase one on `jobs` workers, join, then reference resolution and duplicate
    // detection over the complete index. One result per file, in input order;
    // a file that cannot be read or parsed yields a single Format error.
    std::vector<ValidationResult> lint_files(const std::vector<std::filesystem::path>& files) const;

    // Same pipeline for one file against a fresh index.
    ValidationResult lint_file(const std::filesystem::path& file) const;

    const LinterConfig& config() const { return m_cfg; }

private:
    size_t worker_count(size_t n_files) const;

    LinterConfig m_cfg;
    const schema::SchemaLoader& m_schemas;
};

}  // namespace lint
