#pragma once
#include "schema/SchemaEngine.hpp"

namespace schema {

// Draft-7 engine backed by nlohmann::json_schema::json_validator.
class JsonSchemaEngine final : public SchemaEngine {
public:
    std::unique_ptr<AttributeValidator> compile(const nlohmann::json& schema_doc) const override;
};

} // namespace schema
