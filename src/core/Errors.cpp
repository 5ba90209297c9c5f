#include "core/Errors.hpp"

namespace core {

const char* error_hint(ErrorKind k) {
    switch (k) {
        case ErrorKind::FileNotFound:
        case ErrorKind::Schema:
            return "check --schema-path or PLANLINT_SCHEMA_PATH points at a directory with index.json";
        case ErrorKind::InvalidDocumentType:
            return "run 'planlint list-types' to see available document types";
        case ErrorKind::InvalidIdFormat:
            return "use only lowercase letters, numbers, and single hyphens";
        case ErrorKind::Config:
            return "run 'planlint config' to see which config files are read";
        case ErrorKind::Parse:
        default:
            return nullptr;
    }
}

}  // namespace core
