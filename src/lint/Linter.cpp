#include "lint/Linter.hpp"

#include "doc/Parser.hpp"
#include "lint/DocumentIndex.hpp"
#include "lint/FileFinder.hpp"
#include "lint/Validator.hpp"
#include "lint/WorkerPool.hpp"

#include <atomic>
#include <thread>
#include <unordered_map>

namespace fs = std::filesystem;

namespace lint {

Linter::Linter(LinterConfig cfg, const schema::SchemaLoader& schemas)
    : m_cfg(std::move(cfg)), m_schemas(schemas) {}

std::vector<fs::path> Linter::find_files(const std::vector<std::string>& patterns) const {
    return find_markup_files(patterns, m_cfg.exclude_patterns);
}

size_t Linter::worker_count(size_t n_files) const {
    size_t n = m_cfg.jobs > 0 ? static_cast<size_t>(m_cfg.jobs) : std::thread::hardware_concurrency();
    if (n == 0) n = 1;
    if (n > n_files) n = n_files;
    return n;
}

static DocumentReport check_one(const DocumentValidator& validator, const fs::path& file) {
    try {
        return validator.check_document(doc::parse_file(file));
    } catch (const std::exception& e) {
        DocumentReport rep;
        rep.result = make_parse_error_result(file.string(), e.what());
        return rep;
    }
}

std::vector<ValidationResult> Linter::lint_files(const std::vector<fs::path>& files) const {
    if (files.empty()) return {};

    DocumentIndex index;
    const DocumentValidator validator(m_schemas, index, m_cfg.rules);

    // phase one: parse, validate and index every file
    std::vector<DocumentReport> reports(files.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            const size_t i = next.fetch_add(1);
            if (i >= files.size()) return;
            reports[i] = check_one(validator, files[i]);
        }
    };

    run_workers(worker_count(files.size()), worker);

    // phase two: the index is complete, forward references now resolve
    for (auto& rep : reports) validator.resolve_references(rep);

    if (m_cfg.rules.check_id_uniqueness) {
        std::unordered_map<std::string, size_t> by_path;
        for (size_t i = 0; i < reports.size(); ++i) by_path[reports[i].result.source_path] = i;

        for (auto& conflict : validator.check_id_uniqueness()) {
            auto it = by_path.find(conflict.source_path);
            if (it == by_path.end()) continue;
            add_finding(reports[it->second].result, std::move(conflict.error));
        }
    }

    std::vector<ValidationResult> results;
    results.reserve(reports.size());
    for (auto& rep : reports) results.push_back(std::move(rep.result));
    return results;
}

ValidationResult Linter::lint_file(const fs::path& file) const {
    auto results = lint_files({file});
    return std::move(results.front());
}

}  // namespace lint
