#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "schema/SchemaEngine.hpp"

namespace schema {

struct DocumentTypeDefinition {
    std::string type_name;     // "type" in index.json
    std::string display_name;  // "name"
    std::string description;
    std::string category;      // discovery | design | development | testing | release
    std::string schema_file;   // relative to the schema directory
};

struct TitleRequirement {
    std::optional<bool> required;
    std::optional<std::string> format;  // may contain {placeholders}
    std::optional<std::string> description;
};

struct SectionRequirements {
    std::vector<std::string> required;
    std::vector<std::string> optional;
    std::optional<std::string> description;
};

struct AbstractRequirement {
    std::optional<bool> required;
    std::optional<std::string> description;
};

// Declared in a schema file's "structuralRequirements" object. Every part is optional.
struct StructuralRequirements {
    std::optional<TitleRequirement> title;
    std::optional<SectionRequirements> sections;
    std::optional<AbstractRequirement> abstract_req;
};

// Contents of index.json.
struct SchemaRegistry {
    std::string schema_version;
    std::map<std::string, std::string> schemas;  // type -> $ref
    std::vector<DocumentTypeDefinition> document_types;
};

struct CompiledSchema {
    DocumentTypeDefinition definition;
    std::unique_ptr<AttributeValidator> validator;
    StructuralRequirements structural_requirements;
};

} // namespace schema
