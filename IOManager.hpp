#pragma once

#include <functional>
#include <optional>

#include "types.hpp"

namespace IOManager {
// Opens (appends to) the log file. Without this call log lines only reach the
// handler.
void initialize_logger(const fs::path& logPath);

void set_log_handler(std::function<void(std::string_view)> handler);
void set_verbose(bool verbose);
bool is_verbose();

void log(std::string_view message);
// Emitted only in verbose mode.
void log_debug(std::string_view message);

std::optional<fs::path> get_downloads_folder_path();
fs::path get_default_undo_dir();
fs::path expand_user(const std::string& raw);

// Reads a JSON config file. References to built-in rules may use the rule id,
// its description or its subfolder; they are resolved against base_rules.
std::optional<Config> load_config(const fs::path& configPath,
                                  const std::vector<Rule>& base_rules);
std::optional<Config> parse_config(const json& raw,
                                   const std::vector<Rule>& base_rules);

bool write_json_file(const fs::path& path, const json& payload);
}  // namespace IOManager
