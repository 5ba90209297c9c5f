#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "schema/Registry.hpp"
#include "schema/SchemaEngine.hpp"

namespace schema {

constexpr const char* kIndexFileName = "index.json";

// Loads <schema_path>/index.json once, compiles every referenced schema and
// answers structural lookups. Read-only after load().
class SchemaLoader {
public:
    explicit SchemaLoader(std::filesystem::path schema_path);  // uses JsonSchemaEngine
    SchemaLoader(std::filesystem::path schema_path, std::shared_ptr<const SchemaEngine> engine);

    // Throws core::FileNotFound if the index is absent, core::SchemaError if the
    // index or a schema file cannot be parsed or a schema fails to compile.
    // A missing schema file is a warning and its type is skipped.
    void load();

    const CompiledSchema* get_schema(const std::string& type) const;
    const std::vector<DocumentTypeDefinition>& get_document_types() const { return m_registry.document_types; }
    bool is_valid_type(const std::string& type) const { return get_schema(type) != nullptr; }

    std::vector<std::string> get_required_sections(const std::string& type) const;
    std::vector<std::string> get_optional_sections(const std::string& type) const;
    bool is_abstract_required(const std::string& type) const;
    std::optional<std::string> get_title_format(const std::string& type) const;

    // Throws core::InvalidDocumentType for an unknown type.
    std::vector<std::string> validate_attributes(const std::string& type,
                                                 const std::map<std::string, std::string>& attributes) const;

    const std::filesystem::path& schema_path() const { return m_schema_path; }
    const std::string& schema_version() const { return m_registry.schema_version; }
    size_t schema_count() const { return m_compiled.size(); }
    const std::vector<std::string>& warnings() const { return m_warnings; }

private:
    void load_schema(const DocumentTypeDefinition& def);

    std::filesystem::path m_schema_path;
    std::shared_ptr<const SchemaEngine> m_engine;
    SchemaRegistry m_registry;
    std::map<std::string, CompiledSchema> m_compiled;
    std::vector<std::string> m_warnings;
};

SchemaRegistry parse_schema_registry(const nlohmann::json& j);
StructuralRequirements parse_structural_requirements(const nlohmann::json& j);

} // namespace schema
