#pragma once
#include <string>
#include <vector>

namespace textutil {

// strip ASCII whitespace (space, tab, CR, LF) from both ends
std::string trim(const std::string& s);

// ASCII-only lowercase
std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// split on '\n', drop a trailing '\r' per line; a final newline does not
// produce an extra empty line
std::vector<std::string> split_lines(const std::string& text);

// split on a single character, trimming each piece and dropping empty ones
std::vector<std::string> split_list(const std::string& s, char sep);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}
