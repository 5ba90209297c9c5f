#include "lint/ValidationTypes.hpp"

namespace lint {

const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::Schema: return "Schema";
        case ErrorKind::Structure: return "Structure";
        case ErrorKind::Reference: return "Reference";
        case ErrorKind::IdConflict: return "IdConflict";
        case ErrorKind::Format: return "Format";
        default: return "Unknown";
    }
}

const char* severity_str(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        default: return "unknown";
    }
}

void add_finding(ValidationResult& res, ValidationError e) {
    if (e.severity == Severity::Warning) {
        res.warnings.push_back(std::move(e));
        return;
    }
    res.errors.push_back(std::move(e));
    res.valid = false;
}

ValidationResult make_parse_error_result(const std::string& source_path, const std::string& message) {
    ValidationResult res;
    res.source_path = source_path;

    ValidationError e;
    e.kind = ErrorKind::Format;
    e.severity = Severity::Error;
    e.message = "Failed to parse file: " + message;
    e.rule = rules::kFileParsing;
    add_finding(res, std::move(e));
    return res;
}

}  // namespace lint
