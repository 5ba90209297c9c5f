#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Checked accessors over nlohmann::json. All failures throw std::runtime_error
// with a "where" path so callers can rewrap them into their own error kind.
namespace jsonio {

nlohmann::json read_json_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);

void require_object(const nlohmann::json& j, const std::string& where);
void require_array(const nlohmann::json& j, const std::string& where);

std::string require_string(const nlohmann::json& j, const char* key, const std::string& where);

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key, const std::string& where);
std::optional<bool> optional_bool(const nlohmann::json& j, const char* key, const std::string& where);
std::optional<int> optional_int(const nlohmann::json& j, const char* key, const std::string& where);
std::optional<std::vector<std::string>> optional_string_array(const nlohmann::json& j, const char* key,
                                                              const std::string& where);

}  // namespace jsonio
