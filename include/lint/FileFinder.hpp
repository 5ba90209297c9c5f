#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace lint {

// '*' and '?' stay within one path component, '**' spans any number of them
// ("**/" may also match none).
bool glob_match(const std::string& pattern, const std::string& path);

// True if the pattern matches the path or any trailing run of its components,
// so "node_modules/**" also excludes "docs/node_modules/x.adoc".
bool is_excluded(const std::filesystem::path& path, const std::vector<std::string>& exclude_patterns);

// Each pattern is a file, a directory (walked recursively) or a glob. Only
// markup files survive; excluded files are dropped; result sorted and unique.
std::vector<std::filesystem::path> find_markup_files(const std::vector<std::string>& patterns,
                                                     const std::vector<std::string>& exclude_patterns);

}  // namespace lint
