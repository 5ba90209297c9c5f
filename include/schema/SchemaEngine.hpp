#pragma once
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace schema {

// A compiled schema body, reusable across documents.
class AttributeValidator {
public:
    virtual ~AttributeValidator() = default;

    // Human-readable violations; empty means the instance is valid.
    virtual std::vector<std::string> check(const nlohmann::json& instance) const = 0;
};

// The JSON-Schema capability the loader depends on but does not own.
class SchemaEngine {
public:
    virtual ~SchemaEngine() = default;

    // Throws (any std::exception) if the schema document cannot be compiled.
    virtual std::unique_ptr<AttributeValidator> compile(const nlohmann::json& schema_doc) const = 0;
};

} // namespace schema
