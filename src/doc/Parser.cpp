#include "doc/Parser.hpp"

#include "core/Errors.hpp"
#include "doc/TextUtil.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace doc {

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) throw core::ParseError("failed to read file '" + p.string() + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw core::ParseError("failed to read file '" + p.string() + "'");
    return ss.str();
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "= Title": one '=', whitespace, then at least one more character.
static bool parse_title_line(const std::string& line, std::string& title) {
    if (line.size() < 3 || line[0] != '=' || !is_space(line[1])) return false;
    title = textutil::trim(line.substr(1));
    return true;
}

// "== Heading": a run of '=', whitespace, then at least one more character.
static bool parse_heading_line(const std::string& line, int& level, std::string& title) {
    size_t n = 0;
    while (n < line.size() && line[n] == '=') ++n;
    if (n == 0 || line.size() < n + 2 || !is_space(line[n])) return false;
    level = static_cast<int>(n);
    title = textutil::trim(line.substr(n));
    return true;
}

// ":name: value": the name is everything up to the next ':' and may not be empty.
static bool parse_attribute_line(const std::string& line, std::string& name, std::string& value) {
    if (line.empty() || line[0] != ':') return false;
    const size_t close = line.find(':', 1);
    if (close == std::string::npos || close == 1) return false;
    name = textutil::trim(line.substr(1, close - 1));
    value = textutil::trim(line.substr(close + 1));
    return true;
}

Document parse_content(const std::string& content, const std::string& source_path) {
    Document d;
    d.source_path = source_path;
    d.content = content;

    std::optional<Section> current;
    bool in_header = true;

    const auto lines = textutil::split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const int line_no = static_cast<int>(i) + 1;

        if (textutil::trim(line).empty()) continue;

        std::string title;
        if (in_header && !d.title && parse_title_line(line, title)) {
            d.title = title;
            continue;
        }

        std::string name, value;
        if (in_header && parse_attribute_line(line, name, value)) {
            d.attributes[name] = value;
            continue;
        }

        int level = 0;
        if (parse_heading_line(line, level, title)) {
            in_header = false;
            if (current) d.sections.push_back(std::move(*current));

            Section s;
            s.level = level;
            s.title = title;
            s.source_line = line_no;
            current = std::move(s);
            continue;
        }

        if (in_header) continue;

        if (current) {
            if (!current->content.empty()) current->content.push_back('\n');
            current->content += line;
        } else {
            // body text before any heading
            Section s;
            s.level = 0;
            s.title = kImplicitSectionTitle;
            s.content = line;
            s.source_line = line_no;
            current = std::move(s);
        }
    }

    if (current) d.sections.push_back(std::move(*current));
    return d;
}

Document parse_file(const fs::path& path) {
    return parse_content(read_all(path), path.string());
}

bool is_markup_file(const fs::path& path) {
    const std::string ext = textutil::to_lower(path.extension().string());
    return ext == ".adoc" || ext == ".asciidoc" || ext == ".asc";
}

bool looks_like_markup(const std::string& content) {
    const auto lines = textutil::split_lines(content);
    const size_t n = lines.size() < 20 ? lines.size() : 20;

    int score = 0;
    for (size_t i = 0; i < n; ++i) {
        const std::string t = textutil::trim(lines[i]);

        if (textutil::starts_with(t, "=")) {
            score += 2;
        } else if (textutil::starts_with(t, ":") && textutil::ends_with(t, ":")) {
            score += 1;
        } else if (textutil::starts_with(t, "//")) {
            score += 1;
        } else if (t.find("xref:") != std::string::npos || t.find("<<") != std::string::npos) {
            score += 1;
        }
    }
    return score >= 2;
}

}  // namespace doc
