#pragma once

#include <exception>
#include <string>
#include <vector>

#include "lint/Config.hpp"

namespace cmdutil {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Arguments that are neither flags nor the value of a known value option.
// argv[0] is the command name and is skipped.
std::vector<std::string> positional_args(int argc, char** argv);

// Config file (--config or PLANLINT_CONFIG, else discovery), then
// PLANLINT_SCHEMA_PATH, then --schema-path / --verbose / --jobs, then
// relative paths resolved against the current directory.
lint::LinterConfig load_effective_config(int argc, char** argv);

// "error: <context>: <what>" on stderr, plus a hint line for library errors.
void print_error(const std::exception& e, const std::string& context = "");

}  // namespace cmdutil
