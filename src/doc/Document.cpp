#include "doc/Document.hpp"

#include "core/Errors.hpp"
#include "doc/TextUtil.hpp"

#include <cctype>

namespace doc {

static std::optional<std::string> attribute(const Document& d, const char* key) {
    auto it = d.attributes.find(key);
    if (it == d.attributes.end()) return std::nullopt;
    return it->second;
}

bool Document::has_required_structure() const {
    for (const char* key : {kTypeAttribute, kIdAttribute, kSchemaVersionAttribute}) {
        if (attributes.find(key) == attributes.end()) return false;
    }
    return true;
}

std::optional<std::string> Document::document_type() const { return attribute(*this, kTypeAttribute); }
std::optional<std::string> Document::document_id() const { return attribute(*this, kIdAttribute); }
std::optional<std::string> Document::schema_version() const { return attribute(*this, kSchemaVersionAttribute); }

void Document::validate_id_format() const {
    const auto id = document_id();
    if (!id) throw core::InvalidIdFormat("missing document ID");

    bool charset_ok = !id->empty();
    for (char c : *id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
        if (!ok) {
            charset_ok = false;
            break;
        }
    }
    if (!charset_ok) {
        throw core::InvalidIdFormat("ID '" + *id + "' must contain only lowercase letters, numbers, and hyphens");
    }

    if (id->front() == '-' || id->back() == '-') {
        throw core::InvalidIdFormat("ID '" + *id + "' cannot start or end with a hyphen");
    }

    if (id->find("--") != std::string::npos) {
        throw core::InvalidIdFormat("ID '" + *id + "' cannot contain consecutive hyphens");
    }
}

std::vector<const Section*> Document::sections_with_title(const std::string& t) const {
    std::vector<const Section*> out;
    for (const auto& s : sections) {
        if (s.title == t) out.push_back(&s);
    }
    return out;
}

std::vector<const Section*> Document::level_2_sections() const {
    std::vector<const Section*> out;
    for (const auto& s : sections) {
        if (s.level == 2) out.push_back(&s);
    }
    return out;
}

std::optional<std::string> Document::abstract_content() const {
    bool in_abstract = false;
    std::vector<std::string> collected;

    for (const auto& line : textutil::split_lines(content)) {
        const std::string trimmed = textutil::trim(line);

        if (!in_abstract) {
            if (trimmed == kAbstractMarker) in_abstract = true;
            continue;
        }

        // a heading or another block marker closes the abstract
        if (textutil::starts_with(line, "=") ||
            (textutil::starts_with(line, "[") && textutil::ends_with(line, "]"))) {
            break;
        }
        if (trimmed.empty()) {
            if (!collected.empty()) break;
            continue;
        }
        collected.push_back(line);
    }

    if (collected.empty()) return std::nullopt;
    return textutil::trim(textutil::join(collected, "\n"));
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_kind_char(char c) {
    return (c >= 'a' && c <= 'z') || c == '-';
}

static bool is_id_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

static bool is_repo_char(char c) {
    return c != '#' && c != '[' && c != ']' && !is_space(c);
}

static bool is_version_char(char c) {
    return c != '[' && c != ']' && !is_space(c);
}

// Longest run of chars satisfying pred, starting at pos; returns its end.
template <typename Pred>
static size_t scan_run(const std::string& s, size_t pos, Pred pred) {
    while (pos < s.size() && pred(s[pos])) ++pos;
    return pos;
}

// Optional "[text]" link label; returns the position after it.
static size_t skip_label(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '[') return pos;
    const size_t close = s.find(']', pos + 1);
    return close == std::string::npos ? pos : close + 1;
}

// "kind:id" at pos; returns the end of the id or npos.
static size_t scan_kind_id(const std::string& s, size_t pos, CrossReference& r) {
    const size_t kind_end = scan_run(s, pos, is_kind_char);
    if (kind_end == pos || kind_end >= s.size() || s[kind_end] != ':') return std::string::npos;
    const size_t id_end = scan_run(s, kind_end + 1, is_id_char);
    if (id_end == kind_end + 1) return std::string::npos;

    r.kind = s.substr(pos, kind_end - pos);
    r.id = s.substr(kind_end + 1, id_end - kind_end - 1);
    return id_end;
}

static const char kXrefPrefix[] = "xref:";
static const size_t kXrefPrefixLen = sizeof(kXrefPrefix) - 1;

// xref:story:login-flow[]
static void scan_internal(const std::string& line, int line_no, std::vector<CrossReference>& out) {
    size_t pos = line.find(kXrefPrefix);
    while (pos != std::string::npos) {
        CrossReference r;
        const size_t end = scan_kind_id(line, pos + kXrefPrefixLen, r);
        if (end == std::string::npos) {
            pos = line.find(kXrefPrefix, pos + 1);
            continue;
        }
        r.source_line = line_no;
        out.push_back(std::move(r));
        pos = line.find(kXrefPrefix, skip_label(line, end));
    }
}

// xref:github.com/org/repo#story:login-flow@v1.2[]
static void scan_external(const std::string& line, int line_no, std::vector<CrossReference>& out) {
    size_t pos = line.find(kXrefPrefix);
    while (pos != std::string::npos) {
        const size_t repo_start = pos + kXrefPrefixLen;
        const size_t repo_end = scan_run(line, repo_start, is_repo_char);

        CrossReference r;
        size_t end = std::string::npos;
        if (repo_end > repo_start && repo_end < line.size() && line[repo_end] == '#') {
            end = scan_kind_id(line, repo_end + 1, r);
        }
        if (end == std::string::npos) {
            pos = line.find(kXrefPrefix, pos + 1);
            continue;
        }

        r.is_external = true;
        r.repository = line.substr(repo_start, repo_end - repo_start);
        r.source_line = line_no;
        if (end < line.size() && line[end] == '@') {
            const size_t version_end = scan_run(line, end + 1, is_version_char);
            if (version_end > end + 1) {
                r.version = line.substr(end + 1, version_end - end - 1);
                end = version_end;
            }
        }
        out.push_back(std::move(r));
        pos = line.find(kXrefPrefix, skip_label(line, end));
    }
}

std::vector<CrossReference> Document::extract_cross_references() const {
    std::vector<CrossReference> refs;
    const auto lines = textutil::split_lines(content);

    // per line: internal references first, then external ones
    for (size_t i = 0; i < lines.size(); ++i) {
        const int line_no = static_cast<int>(i) + 1;
        scan_internal(lines[i], line_no, refs);
        scan_external(lines[i], line_no, refs);
    }

    return refs;
}

// "* [x] text" or "* [ ] text", optionally indented.
static bool parse_checklist_line(const std::string& line, ChecklistItem& item) {
    size_t p = scan_run(line, 0, is_space);
    if (p >= line.size() || line[p] != '*') return false;

    const size_t box = scan_run(line, p + 1, is_space);
    if (box == p + 1) return false;
    if (box + 3 > line.size() || line[box] != '[' || line[box + 2] != ']') return false;
    const char mark = line[box + 1];
    if (mark != 'x' && mark != ' ') return false;

    p = box + 3;
    if (p >= line.size() || !is_space(line[p]) || line.size() - p < 2) return false;

    item.checked = mark == 'x';
    item.text = textutil::trim(line.substr(p));
    return true;
}

std::vector<ChecklistItem> Document::extract_checklist_items() const {
    std::vector<ChecklistItem> items;
    const auto lines = textutil::split_lines(content);

    for (size_t i = 0; i < lines.size(); ++i) {
        ChecklistItem item;
        if (!parse_checklist_line(lines[i], item)) continue;
        item.source_line = static_cast<int>(i) + 1;
        items.push_back(std::move(item));
    }
    return items;
}

}  // namespace doc
