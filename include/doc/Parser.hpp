#pragma once

#include <filesystem>
#include <string>

#include "doc/Document.hpp"

namespace doc {

// Single forward scan: title and attributes are recognised only in the header,
// which ends at the first heading line. Accepts any text.
Document parse_content(const std::string& content, const std::string& source_path);

// Throws core::ParseError if the file cannot be read.
Document parse_file(const std::filesystem::path& path);

// Extension check (.adoc, .asciidoc, .asc; case-insensitive). Used for file discovery only.
bool is_markup_file(const std::filesystem::path& path);

// Heuristic over the first 20 lines. Advisory only.
bool looks_like_markup(const std::string& content);

}  // namespace doc
