#include "schema/SchemaLoader.hpp"

#include "core/Errors.hpp"
#include "io/JsonIO.hpp"
#include "schema/JsonSchemaEngine.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace schema {

SchemaRegistry parse_schema_registry(const json& j) {
    jsonio::require_object(j, "index");

    SchemaRegistry reg;
    reg.schema_version = jsonio::require_string(j, "schemaVersion", "index");

    if (j.contains("schemas")) {
        const json& schemas = j.at("schemas");
        jsonio::require_object(schemas, "index.schemas");
        for (auto it = schemas.begin(); it != schemas.end(); ++it) {
            jsonio::require_object(it.value(), "index.schemas." + it.key());
            reg.schemas[it.key()] = jsonio::require_string(it.value(), "$ref", "index.schemas." + it.key());
        }
    }

    if (!j.contains("documentTypes")) {
        throw std::runtime_error("index missing required field: documentTypes");
    }
    const json& types = j.at("documentTypes");
    jsonio::require_array(types, "index.documentTypes");

    for (size_t i = 0; i < types.size(); ++i) {
        std::ostringstream oss;
        oss << "index.documentTypes[" << i << "]";
        const std::string where = oss.str();
        const json& t = types.at(i);
        jsonio::require_object(t, where);

        DocumentTypeDefinition def;
        def.type_name    = jsonio::require_string(t, "type", where);
        def.display_name = jsonio::require_string(t, "name", where);
        def.description  = jsonio::require_string(t, "description", where);
        def.category     = jsonio::require_string(t, "category", where);
        def.schema_file  = jsonio::require_string(t, "schema", where);
        reg.document_types.push_back(std::move(def));
    }

    return reg;
}

StructuralRequirements parse_structural_requirements(const json& j) {
    const std::string where = "structuralRequirements";
    jsonio::require_object(j, where);

    StructuralRequirements sr;

    if (j.contains("title") && !j.at("title").is_null()) {
        const json& t = j.at("title");
        jsonio::require_object(t, where + ".title");
        TitleRequirement tr;
        tr.required = jsonio::optional_bool(t, "required", where + ".title");
        tr.format = jsonio::optional_string(t, "format", where + ".title");
        tr.description = jsonio::optional_string(t, "description", where + ".title");
        sr.title = tr;
    }

    if (j.contains("sections") && !j.at("sections").is_null()) {
        const json& s = j.at("sections");
        jsonio::require_object(s, where + ".sections");
        SectionRequirements req;
        req.required = jsonio::optional_string_array(s, "required", where + ".sections").value_or(std::vector<std::string>{});
        req.optional = jsonio::optional_string_array(s, "optional", where + ".sections").value_or(std::vector<std::string>{});
        req.description = jsonio::optional_string(s, "description", where + ".sections");
        sr.sections = req;
    }

    if (j.contains("abstract") && !j.at("abstract").is_null()) {
        const json& a = j.at("abstract");
        jsonio::require_object(a, where + ".abstract");
        AbstractRequirement ar;
        ar.required = jsonio::optional_bool(a, "required", where + ".abstract");
        ar.description = jsonio::optional_string(a, "description", where + ".abstract");
        sr.abstract_req = ar;
    }

    return sr;
}

SchemaLoader::SchemaLoader(fs::path schema_path)
    : SchemaLoader(std::move(schema_path), std::make_shared<JsonSchemaEngine>()) {}

SchemaLoader::SchemaLoader(fs::path schema_path, std::shared_ptr<const SchemaEngine> engine)
    : m_schema_path(std::move(schema_path)), m_engine(std::move(engine)) {
    if (!m_engine) throw std::invalid_argument("SchemaLoader: engine must not be null");
}

void SchemaLoader::load() {
    const fs::path index_path = m_schema_path / kIndexFileName;
    if (!fs::exists(index_path)) {
        throw core::FileNotFound("schema index not found at " + index_path.string());
    }

    try {
        m_registry = parse_schema_registry(jsonio::read_json_file(index_path));
    } catch (const core::Error&) {
        throw;
    } catch (const std::exception& e) {
        throw core::SchemaError(std::string("invalid schema index: ") + e.what());
    }

    m_compiled.clear();
    m_warnings.clear();
    for (const auto& def : m_registry.document_types) {
        load_schema(def);
    }
}

void SchemaLoader::load_schema(const DocumentTypeDefinition& def) {
    const fs::path path = m_schema_path / def.schema_file;

    if (!fs::exists(path)) {
        const std::string msg = "schema file not found: " + path.string();
        std::cerr << "warning: " << msg << "\n";
        m_warnings.push_back(msg);
        return;
    }

    json schema_doc;
    try {
        schema_doc = jsonio::read_json_file(path);
    } catch (const std::exception& e) {
        throw core::SchemaError("failed to read schema for " + def.type_name + ": " + e.what());
    }

    CompiledSchema cs;
    cs.definition = def;

    if (schema_doc.is_object() && schema_doc.contains("structuralRequirements")) {
        try {
            cs.structural_requirements = parse_structural_requirements(schema_doc.at("structuralRequirements"));
        } catch (const std::exception& e) {
            const std::string msg = "ignoring malformed structuralRequirements for " + def.type_name + ": " + e.what();
            std::cerr << "warning: " << msg << "\n";
            m_warnings.push_back(msg);
            cs.structural_requirements = StructuralRequirements{};
        }
    }

    try {
        cs.validator = m_engine->compile(schema_doc);
    } catch (const std::exception& e) {
        throw core::SchemaError("failed to compile schema for " + def.type_name + ": " + e.what());
    }
    if (!cs.validator) {
        throw core::SchemaError("failed to compile schema for " + def.type_name + ": engine returned no validator");
    }

    m_compiled[def.type_name] = std::move(cs);
}

const CompiledSchema* SchemaLoader::get_schema(const std::string& type) const {
    auto it = m_compiled.find(type);
    if (it == m_compiled.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> SchemaLoader::get_required_sections(const std::string& type) const {
    const CompiledSchema* s = get_schema(type);
    if (!s || !s->structural_requirements.sections) return {};
    return s->structural_requirements.sections->required;
}

std::vector<std::string> SchemaLoader::get_optional_sections(const std::string& type) const {
    const CompiledSchema* s = get_schema(type);
    if (!s || !s->structural_requirements.sections) return {};
    return s->structural_requirements.sections->optional;
}

bool SchemaLoader::is_abstract_required(const std::string& type) const {
    const CompiledSchema* s = get_schema(type);
    if (!s || !s->structural_requirements.abstract_req) return false;
    return s->structural_requirements.abstract_req->required.value_or(false);
}

std::optional<std::string> SchemaLoader::get_title_format(const std::string& type) const {
    const CompiledSchema* s = get_schema(type);
    if (!s || !s->structural_requirements.title) return std::nullopt;
    return s->structural_requirements.title->format;
}

std::vector<std::string> SchemaLoader::validate_attributes(const std::string& type,
                                                           const std::map<std::string, std::string>& attributes) const {
    const CompiledSchema* s = get_schema(type);
    if (!s) throw core::InvalidDocumentType(type);

    json instance = json::object();
    for (const auto& [k, v] : attributes) instance[k] = v;

    return s->validator->check(instance);
}

} // namespace schema
