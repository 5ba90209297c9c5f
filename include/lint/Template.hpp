#pragma once

#include <optional>
#include <string>

#include "schema/SchemaLoader.hpp"

namespace lint {

struct TemplateRequest {
    std::string type;
    std::string id;
    std::optional<std::string> title;   // defaults to the type's display name
    std::optional<std::string> author;  // defaults to "Author Name"
    std::string date;                   // YYYY-MM-DD
};

// Skeleton document with header attributes, an abstract block when the type
// requires one and a stub per required section.
// Throws core::InvalidDocumentType if the type is not in the registry.
std::string create_document_template(const schema::SchemaLoader& schemas, const TemplateRequest& req);

// Local date as YYYY-MM-DD.
std::string today_iso_date();

}  // namespace lint
