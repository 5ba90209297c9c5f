#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lint {

enum class ErrorKind {
    Schema,
    Structure,
    Reference,
    IdConflict,
    Format
};

enum class Severity {
    Error,
    Warning
};

struct Location {
    std::optional<int> line;
    std::optional<int> column;
    std::optional<std::string> section;
};

struct ValidationError {
    ErrorKind kind = ErrorKind::Format;
    Severity severity = Severity::Error;
    std::string message;
    std::optional<Location> location;
    std::optional<std::string> rule;
    std::optional<std::string> suggestion;
};

struct ValidationResult {
    std::string source_path;
    std::optional<std::string> document_type;
    std::optional<std::string> document_id;
    bool valid = true;  // errors.empty(); warnings never count
    std::vector<ValidationError> errors;
    std::vector<ValidationError> warnings;
};

// Rule identifiers attached to ValidationError::rule.
namespace rules {
inline constexpr const char* kRequireStructure = "require-structure";
inline constexpr const char* kValidDocumentType = "valid-document-type";
inline constexpr const char* kSchemaValidation = "schema-validation";
inline constexpr const char* kRequiredSections = "required-sections";
inline constexpr const char* kRequiredAbstract = "required-abstract";
inline constexpr const char* kTitleFormat = "title-format";
inline constexpr const char* kIdFormat = "id-format";
inline constexpr const char* kExternalReference = "external-reference";
inline constexpr const char* kReferenceIntegrity = "reference-integrity";
inline constexpr const char* kUniqueIds = "unique-ids";
inline constexpr const char* kFileParsing = "file-parsing";
}  // namespace rules

const char* error_kind_str(ErrorKind k);
const char* severity_str(Severity s);

// Appends to errors or warnings by severity and keeps `valid` in sync.
void add_finding(ValidationResult& res, ValidationError e);

// A single Format error standing in for a file that could not be parsed.
ValidationResult make_parse_error_result(const std::string& source_path, const std::string& message);

}  // namespace lint
