#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace doc {

// Header attributes every planning document must declare.
inline constexpr const char* kTypeAttribute = "type";
inline constexpr const char* kIdAttribute = "id";
inline constexpr const char* kSchemaVersionAttribute = "schema-version";

inline constexpr const char* kAbstractMarker = "[abstract]";
inline constexpr const char* kImplicitSectionTitle = "Content";

struct Section {
    int level = 0;                   // number of leading '=' (0 = implicit body)
    std::string title;
    std::string content;             // body lines joined by '\n'
    std::optional<int> source_line;  // 1-based line of the heading

    bool operator==(const Section& o) const {
        return level == o.level && title == o.title && content == o.content &&
               source_line == o.source_line;
    }
    bool operator!=(const Section& o) const { return !(*this == o); }
};

struct CrossReference {
    std::string kind;
    std::string id;
    std::optional<int> source_line;
    bool is_external = false;
    std::optional<std::string> version;     // external only
    std::optional<std::string> repository;  // external only
};

struct ChecklistItem {
    std::string text;
    bool checked = false;
    int source_line = 0;
};

struct Document {
    std::string source_path;
    std::optional<std::string> title;
    std::map<std::string, std::string> attributes;
    std::string content;  // raw text as read
    std::vector<Section> sections;

    bool has_required_structure() const;

    std::optional<std::string> document_type() const;
    std::optional<std::string> document_id() const;
    std::optional<std::string> schema_version() const;

    // Throws core::InvalidIdFormat naming the violated rule.
    void validate_id_format() const;

    std::vector<const Section*> sections_with_title(const std::string& title) const;
    std::vector<const Section*> level_2_sections() const;

    std::optional<std::string> abstract_content() const;

    // Recomputed from content on every call.
    std::vector<CrossReference> extract_cross_references() const;
    std::vector<ChecklistItem> extract_checklist_items() const;
};

}  // namespace doc
