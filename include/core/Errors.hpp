#pragma once

#include <stdexcept>
#include <string>

namespace core {

enum class ErrorKind {
    FileNotFound,
    Schema,
    InvalidDocumentType,
    InvalidIdFormat,
    Parse,
    Config
};

// Follow-up advice for a user facing this kind of failure, or nullptr.
const char* error_hint(ErrorKind k);

// Base for every failure the library throws. Recoverable, per-document problems
// are reported as lint::ValidationError items instead.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class FileNotFound : public Error {
public:
    explicit FileNotFound(const std::string& what)
        : Error(ErrorKind::FileNotFound, "file not found: " + what) {}
};

class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& what)
        : Error(ErrorKind::Schema, "schema error: " + what) {}
};

class InvalidDocumentType : public Error {
public:
    explicit InvalidDocumentType(const std::string& type)
        : Error(ErrorKind::InvalidDocumentType, "invalid document type: " + type) {}
};

class InvalidIdFormat : public Error {
public:
    explicit InvalidIdFormat(const std::string& what)
        : Error(ErrorKind::InvalidIdFormat, "invalid id format: " + what) {}
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string& what)
        : Error(ErrorKind::Parse, "parse error: " + what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what)
        : Error(ErrorKind::Config, "config error: " + what) {}
};

}  // namespace core
