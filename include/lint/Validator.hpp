#pragma once

#include <string>
#include <vector>

#include "doc/Document.hpp"
#include "lint/Config.hpp"
#include "lint/DocumentIndex.hpp"
#include "lint/ValidationTypes.hpp"
#include "schema/SchemaLoader.hpp"

namespace lint {

// Outcome of phase one for one document.
struct DocumentReport {
    ValidationResult result;
    // Internal references, resolved only once the whole batch is indexed.
    std::vector<doc::CrossReference> pending_references;
};

struct IdConflict {
    std::string source_path;  // the occurrence this error belongs to
    ValidationError error;
};

// Validation runs in two phases separated by a barrier:
//   1. check_document() per file (any number of workers), which also indexes it;
//   2. resolve_references() and check_id_uniqueness(), after every worker of
//      phase one has finished.
// The index is a capability handed in by the caller, shared by all workers.
class DocumentValidator {
public:
    DocumentValidator(const schema::SchemaLoader& schemas, DocumentIndex& index, ValidationRules rules = {});

    DocumentReport check_document(const doc::Document& d) const;

    void resolve_references(DocumentReport& report) const;

    std::vector<IdConflict> check_id_uniqueness() const;

    // Both phases for one document, resolved against whatever is indexed so far.
    ValidationResult validate_document(const doc::Document& d) const;

private:
    void check_schema(const doc::Document& d, const std::string& type, ValidationResult& res) const;
    void check_id(const doc::Document& d, ValidationResult& res) const;
    void collect_references(const doc::Document& d, DocumentReport& rep) const;
    void index_document(const doc::Document& d) const;

    const schema::SchemaLoader& m_schemas;
    DocumentIndex& m_index;
    ValidationRules m_rules;
};

}  // namespace lint
