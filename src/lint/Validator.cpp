#include "lint/Validator.hpp"

#include "core/Errors.hpp"
#include "doc/TextUtil.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace lint {

static ValidationError make_error(ErrorKind kind, const std::string& msg, const char* rule,
                                  const std::string& suggestion = "") {
    ValidationError e;
    e.kind = kind;
    e.severity = Severity::Error;
    e.message = msg;
    e.rule = rule;
    if (!suggestion.empty()) e.suggestion = suggestion;
    return e;
}

static ValidationError make_warning(ErrorKind kind, const std::string& msg, const char* rule) {
    ValidationError e = make_error(kind, msg, rule);
    e.severity = Severity::Warning;
    return e;
}

static std::optional<Location> line_location(const std::optional<int>& line) {
    if (!line) return std::nullopt;
    Location loc;
    loc.line = line;
    return loc;
}

DocumentValidator::DocumentValidator(const schema::SchemaLoader& schemas, DocumentIndex& index, ValidationRules rules)
    : m_schemas(schemas), m_index(index), m_rules(rules) {}

DocumentReport DocumentValidator::check_document(const doc::Document& d) const {
    DocumentReport rep;
    ValidationResult& res = rep.result;
    res.source_path = d.source_path;

    if (!d.has_required_structure()) {
        add_finding(res, make_error(
            ErrorKind::Structure,
            std::string("Document missing required attributes (:") + doc::kTypeAttribute + ":, :" +
                doc::kIdAttribute + ":, :" + doc::kSchemaVersionAttribute + ":)",
            rules::kRequireStructure,
            "Add the required attributes to the document header"));
        return rep;
    }

    res.document_type = d.document_type();
    res.document_id = d.document_id();

    const std::string& type = *res.document_type;
    if (!m_schemas.is_valid_type(type)) {
        add_finding(res, make_error(ErrorKind::Schema, "Unknown document type: " + type,
                                    rules::kValidDocumentType,
                                    "Run 'planlint list-types' to see available document types"));
    } else {
        check_schema(d, type, res);
    }

    check_id(d, res);
    collect_references(d, rep);
    index_document(d);

    return rep;
}

void DocumentValidator::check_schema(const doc::Document& d, const std::string& type, ValidationResult& res) const {
    // attributes against the JSON schema
    try {
        for (const auto& msg : m_schemas.validate_attributes(type, d.attributes)) {
            ValidationError e = make_error(ErrorKind::Schema, msg, rules::kSchemaValidation);
            Location loc;
            loc.section = "attributes";
            e.location = loc;
            add_finding(res, std::move(e));
        }
    } catch (const std::exception& ex) {
        add_finding(res, make_error(ErrorKind::Schema, std::string("Schema validation failed: ") + ex.what(),
                                    rules::kSchemaValidation));
    }

    // required == sections, by exact title
    std::vector<std::string> present;
    for (const doc::Section* s : d.level_2_sections()) present.push_back(s->title);

    for (const auto& required : m_schemas.get_required_sections(type)) {
        if (std::find(present.begin(), present.end(), required) != present.end()) continue;
        add_finding(res, make_error(ErrorKind::Structure, "Missing required section: " + required,
                                    rules::kRequiredSections,
                                    "Add a '== " + required + "' section to your document"));
    }

    if (m_schemas.is_abstract_required(type) && !d.abstract_content()) {
        add_finding(res, make_error(ErrorKind::Structure, "Document requires an abstract",
                                    rules::kRequiredAbstract,
                                    std::string("Add an ") + doc::kAbstractMarker + " block after the title"));
    }

    // advisory only: a format with {placeholders} cannot be checked mechanically
    const auto title_format = m_schemas.get_title_format(type);
    if (title_format && title_format->find('{') != std::string::npos) {
        add_finding(res, make_warning(ErrorKind::Format,
                                      "Consider following the recommended title format: " + *title_format,
                                      rules::kTitleFormat));
    }
}

void DocumentValidator::check_id(const doc::Document& d, ValidationResult& res) const {
    try {
        d.validate_id_format();
    } catch (const core::InvalidIdFormat& ex) {
        add_finding(res, make_error(ErrorKind::Format, ex.what(), rules::kIdFormat,
                                    "Use only lowercase letters, numbers, and single hyphens"));
    }
}

void DocumentValidator::collect_references(const doc::Document& d, DocumentReport& rep) const {
    for (auto& ref : d.extract_cross_references()) {
        if (ref.is_external) {
            ValidationError w = make_warning(ErrorKind::Reference,
                                             "External reference cannot be validated: " + ref.kind + ":" + ref.id,
                                             rules::kExternalReference);
            w.location = line_location(ref.source_line);
            add_finding(rep.result, std::move(w));
            continue;
        }
        if (m_rules.validate_references) rep.pending_references.push_back(std::move(ref));
    }
}

void DocumentValidator::index_document(const doc::Document& d) const {
    const auto type = d.document_type();
    const auto id = d.document_id();
    if (!type || !id) return;

    IndexEntry entry;
    entry.source_path = d.source_path;
    entry.title = d.title;
    m_index.insert(*type, *id, std::move(entry));
}

void DocumentValidator::resolve_references(DocumentReport& report) const {
    for (const auto& ref : report.pending_references) {
        if (m_index.contains(ref.kind, ref.id)) continue;

        ValidationError e = make_error(ErrorKind::Reference,
                                       "Reference to non-existent document: " + ref.kind + ":" + ref.id,
                                       rules::kReferenceIntegrity,
                                       "Create the referenced document or fix the reference");
        e.location = line_location(ref.source_line);
        add_finding(report.result, std::move(e));
    }
    report.pending_references.clear();
}

std::vector<IdConflict> DocumentValidator::check_id_uniqueness() const {
    // id -> distinct (type, source_path) occurrences, first-seen order
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> by_id;

    for (const auto& [type, ids] : m_index.snapshot()) {
        for (const auto& [id, entries] : ids) {
            auto& occ = by_id[id];
            for (const auto& entry : entries) {
                auto key = std::make_pair(type, entry.source_path);
                if (std::find(occ.begin(), occ.end(), key) == occ.end()) occ.push_back(std::move(key));
            }
        }
    }

    std::vector<IdConflict> conflicts;
    for (const auto& [id, occ] : by_id) {
        if (occ.size() < 2) continue;

        for (const auto& self : occ) {
            std::vector<std::string> others;
            for (const auto& other : occ) {
                if (other == self) continue;
                others.push_back(other.first + " in " + other.second);
            }

            IdConflict c;
            c.source_path = self.second;
            c.error = make_error(ErrorKind::IdConflict,
                                 "Duplicate ID '" + id + "' found in " + self.first + " at " + self.second +
                                     " (conflicts with " + textutil::join(others, ", ") + ")",
                                 rules::kUniqueIds, "Change one of the conflicting IDs");
            conflicts.push_back(std::move(c));
        }
    }
    return conflicts;
}

ValidationResult DocumentValidator::validate_document(const doc::Document& d) const {
    DocumentReport rep = check_document(d);
    resolve_references(rep);
    return std::move(rep.result);
}

}  // namespace lint
