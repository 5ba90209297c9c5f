#include "schema/JsonSchemaEngine.hpp"

#include <nlohmann/json-schema.hpp>

#include <mutex>

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace schema {

namespace {

// Keeps going after the first violation so every problem is reported.
class CollectingErrorHandler : public nlohmann::json_schema::basic_error_handler {
public:
    void error(const json::json_pointer& ptr, const json& instance, const std::string& message) override {
        nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
        std::string where = ptr.to_string();
        if (where.empty()) where = "/";
        messages.push_back("Validation error at " + where + ": " + message);
    }

    std::vector<std::string> messages;
};

class JsonSchemaValidator final : public AttributeValidator {
public:
    explicit JsonSchemaValidator(const json& schema_doc)
        : m_validator(nullptr, nlohmann::json_schema::default_string_format_check) {
        m_validator.set_root_schema(schema_doc);
    }

    std::vector<std::string> check(const json& instance) const override {
        CollectingErrorHandler handler;
        {
            // json_validator makes no thread-safety promise for concurrent validate()
            std::lock_guard<std::mutex> lock(m_mutex);
            m_validator.validate(instance, handler);
        }
        return handler.messages;
    }

private:
    json_validator m_validator;
    mutable std::mutex m_mutex;
};

} // namespace

std::unique_ptr<AttributeValidator> JsonSchemaEngine::compile(const json& schema_doc) const {
    return std::make_unique<JsonSchemaValidator>(schema_doc);
}

} // namespace schema
