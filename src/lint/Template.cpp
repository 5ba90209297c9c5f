#include "lint/Template.hpp"

#include "core/Errors.hpp"
#include "doc/Document.hpp"
#include "doc/TextUtil.hpp"

#include <ctime>
#include <sstream>

namespace lint {

std::string create_document_template(const schema::SchemaLoader& schemas, const TemplateRequest& req) {
    const schema::DocumentTypeDefinition* def = nullptr;
    for (const auto& t : schemas.get_document_types()) {
        if (t.type_name == req.type) {
            def = &t;
            break;
        }
    }
    if (!def) throw core::InvalidDocumentType(req.type);

    std::ostringstream out;
    out << "= " << req.title.value_or(def->display_name) << "\n";
    out << ":" << doc::kTypeAttribute << ": " << req.type << "\n";
    out << ":" << doc::kIdAttribute << ": " << req.id << "\n";
    out << ":status: draft\n";
    out << ":created: " << req.date << "\n";
    out << ":author: " << req.author.value_or("Author Name") << "\n";
    out << ":" << doc::kSchemaVersionAttribute << ": 1.0\n\n";

    if (schemas.is_abstract_required(req.type)) {
        out << doc::kAbstractMarker << "\n";
        out << "Brief description of this " << textutil::to_lower(def->display_name) << ".\n\n";
    }

    for (const auto& section : schemas.get_required_sections(req.type)) {
        out << "== " << section << "\n\n";
        out << "// Add content for " << section << "\n\n";
    }

    return out.str();
}

std::string today_iso_date() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm) == 0) return "";
    return buf;
}

}  // namespace lint
