#include "IOManager.hpp"

#include <chrono>
#include <cmath>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>

#include "RuleCatalog.hpp"
#include "utils.hpp"

#ifdef _WIN32
#include <Shlobj.h>
#else
#include <cstdlib>  // For getenv
#endif

namespace {
std::ofstream g_log_stream;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

bool g_verbose = false;

std::string resolve_rule_reference(
    const std::map<std::string, std::string>& aliases, std::string_view ref) {
  const std::string token = normalize_identifier(ref);
  if (auto it = aliases.find(token); it != aliases.end()) {
    return it->second;
  }
  return token;
}

std::optional<bool> optional_bool(const json& table, const char* key) {
  if (!table.contains(key)) return std::nullopt;
  const json& v = table.at(key);
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number()) return v.get<double>() != 0.0;
  if (v.is_string()) {
    const std::string s = string_to_lower_ascii(v.get<std::string>());
    return s == "true" || s == "1" || s == "yes";
  }
  return !v.is_null();
}

std::string scalar_to_string(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

Condition parse_condition(const std::string& type_name, const json& value) {
  Condition c;
  c.type = parse_condition_type(type_name);
  switch (c.type) {
    case ConditionType::EXTENSION_ANY:
    case ConditionType::NAME_CONTAINS:
    case ConditionType::KIND:
      if (value.is_array()) {
        for (const auto& v : value) c.values.push_back(scalar_to_string(v));
      } else {
        c.values.push_back(scalar_to_string(value));
      }
      if (c.type == ConditionType::EXTENSION_ANY) {
        for (auto& ext : c.values) ext = normalize_extension(ext);
      }
      break;
    case ConditionType::CREATED_WITHIN_DAYS:
    case ConditionType::SIZE_GTE:
    case ConditionType::SIZE_LTE:
      if (value.is_number()) {
        c.threshold = value.get<double>();
      } else if (value.is_string()) {
        c.threshold = std::stod(value.get<std::string>());
      } else {
        throw std::invalid_argument(
            std::format("condition '{}' needs a numeric value", type_name));
      }
      if (!std::isfinite(c.threshold)) {
        throw std::invalid_argument(
            std::format("condition '{}' needs a finite value", type_name));
      }
      break;
    case ConditionType::IS_FOLDER:
    case ConditionType::IS_ALIAS:
    case ConditionType::HAS_TAG:
      c.flag = value.is_boolean() ? value.get<bool>() : !value.is_null();
      break;
    case ConditionType::UNKNOWN:
      IOManager::log(std::format(
          "Warning: unknown condition type '{}' never matches.", type_name));
      break;
  }
  return c;
}

Rule parse_custom_rule(const std::string& raw_id, const json& raw) {
  if (!raw.is_object()) {
    throw std::invalid_argument(
        std::format("custom rule '{}' must be a table", raw_id));
  }
  const std::string description =
      raw.contains("description") && raw["description"].is_string()
          ? raw["description"].get<std::string>()
          : std::format("Custom rule {}", raw_id);
  std::string subfolder = std::format("Custom/{}", raw_id);
  if (raw.contains("subfolder") && raw["subfolder"].is_string()) {
    subfolder = raw["subfolder"].get<std::string>();
  } else if (raw.contains("folder_name") && raw["folder_name"].is_string()) {
    subfolder = raw["folder_name"].get<std::string>();
  }
  const bool enabled = optional_bool(raw, "enabled").value_or(true);

  RuleMode mode = RuleMode::ALL;
  if (raw.contains("mode")) {
    const std::string mode_str =
        string_to_lower_ascii(trim_ascii(raw["mode"].get<std::string>()));
    if (mode_str == "any") {
      mode = RuleMode::ANY;
    } else if (mode_str != "all") {
      throw std::invalid_argument(
          std::format("custom rule '{}' has invalid mode", raw_id));
    }
  }

  std::vector<Condition> conditions;
  if (raw.contains("conditions")) {
    const json& list = raw["conditions"];
    if (!list.is_array()) {
      throw std::invalid_argument(std::format(
          "custom rule '{}' conditions must be an array", raw_id));
    }
    for (const auto& entry : list) {
      if (!entry.is_object() || !entry.contains("type") ||
          !entry["type"].is_string()) {
        throw std::invalid_argument(std::format(
            "custom rule '{}' has a condition without a type", raw_id));
      }
      if (!entry.contains("value")) {
        throw std::invalid_argument(std::format(
            "custom rule '{}' has a condition without a value", raw_id));
      }
      conditions.push_back(
          parse_condition(entry["type"].get<std::string>(), entry["value"]));
    }
  }

  // Shortcut fields for compact configs.
  if (conditions.empty()) {
    static const std::vector<std::pair<const char*, const char*>> shortcuts = {
        {"kind", "kind"},
        {"name_contains", "name_contains"},
        {"created_within_days", "created_within_days"},
        {"size_gte", "size_gte"},
        {"size_lte", "size_lte"},
        {"extensions", "extension_any"}};
    for (const auto& [key, type_name] : shortcuts) {
      if (raw.contains(key)) {
        conditions.push_back(parse_condition(type_name, raw[key]));
      }
    }
  }

  return make_custom_rule(raw_id, description, subfolder, enabled, mode,
                          std::move(conditions));
}
}  // namespace

void IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) g_log_stream.close();
  if (logPath.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(logPath.parent_path(), ec);
  }
  g_log_stream.open(logPath, std::ios_base::app);
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::set_verbose(bool verbose) {
  std::scoped_lock lock(log_mutex);
  g_verbose = verbose;
}

bool IOManager::is_verbose() {
  std::scoped_lock lock(log_mutex);
  return g_verbose;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_stream.is_open()) {
    g_log_stream << full_message << "\n" << std::flush;
  }
}

void IOManager::log_debug(std::string_view message) {
  if (is_verbose()) {
    log(message);
  }
}

std::optional<fs::path> IOManager::get_downloads_folder_path() {
#ifdef _WIN32
  PWSTR path_raw = nullptr;
  if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_Downloads, 0, NULL, &path_raw))) {
    fs::path result(path_raw);
    CoTaskMemFree(path_raw);
    return result;
  }
#else
  const char* home_dir = getenv("HOME");
  if (!home_dir) return std::nullopt;

  const char* xdg_download_dir_env = getenv("XDG_DOWNLOAD_DIR");
  if (xdg_download_dir_env && *xdg_download_dir_env) {
    fs::path p(xdg_download_dir_env);
    if (p.string().starts_with("$HOME")) {
      return fs::path(home_dir) / p.string().substr(6);
    }
    if (p.is_absolute()) return p;
  }

  fs::path user_dirs_file = fs::path(home_dir) / ".config/user-dirs.dirs";
  if (fs::exists(user_dirs_file)) {
    std::ifstream file(user_dirs_file);
    std::string line;
    while (std::getline(file, line)) {
      if (line.empty() || line[0] == '#') continue;

      if (line.starts_with("XDG_DOWNLOAD_DIR=")) {
        auto first_quote = line.find('"');
        if (first_quote == std::string::npos) continue;
        auto last_quote = line.rfind('"');
        if (last_quote == std::string::npos || last_quote <= first_quote)
          continue;

        std::string path_str =
            line.substr(first_quote + 1, last_quote - first_quote - 1);
        if (path_str.starts_with("$HOME")) {
          path_str.replace(0, 5, home_dir);
        }
        return path_from_utf8(path_str);
      }
    }
  }
  return fs::path(home_dir) / "Downloads";
#endif
  return std::nullopt;
}

fs::path IOManager::expand_user(const std::string& raw) {
  if (raw == "~" || raw.starts_with("~/")) {
#ifdef _WIN32
    const char* home_dir = getenv("USERPROFILE");
#else
    const char* home_dir = getenv("HOME");
#endif
    if (home_dir) {
      return fs::path(home_dir) /
             path_from_utf8(raw.size() > 2 ? raw.substr(2) : "");
    }
  }
  return path_from_utf8(raw);
}

fs::path IOManager::get_default_undo_dir() {
  return expand_user("~/.downloads-organize/undos");
}

std::optional<Config> IOManager::load_config(
    const fs::path& configPath, const std::vector<Rule>& base_rules) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    return parse_config(json::parse(configFile), base_rules);
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

std::optional<Config> IOManager::parse_config(
    const json& raw, const std::vector<Rule>& base_rules) {
  if (!raw.is_object()) {
    log("Error parsing config: root must be an object");
    return std::nullopt;
  }
  try {
    Config config;
    const auto aliases = rule_reference_aliases(base_rules);

    if (raw.contains("ignore") && raw["ignore"].is_object()) {
      const json& ignore = raw["ignore"];
      if (ignore.contains("extensions") && ignore["extensions"].is_array()) {
        for (const auto& ext : ignore["extensions"]) {
          config.ignore_extensions.insert(
              normalize_extension(scalar_to_string(ext)));
        }
      }
      if (ignore.contains("paths") && ignore["paths"].is_array()) {
        for (const auto& p : ignore["paths"]) {
          std::string token = string_to_lower_ascii(trim_ascii(scalar_to_string(p)));
          if (!token.empty()) config.ignore_paths.insert(std::move(token));
        }
      }
      config.ignore_aliases = optional_bool(ignore, "aliases");
      config.ignore_folders = optional_bool(ignore, "folders");
      config.ignore_tagged = optional_bool(ignore, "tagged");
    }

    if (raw.contains("options") && raw["options"].is_object()) {
      const json& options = raw["options"];
      config.include_subfolders = optional_bool(options, "include_subfolders");
      config.include_folders = optional_bool(options, "include_folders");
      config.include_empty_folders =
          optional_bool(options, "include_empty_folders");
      config.include_tagged = optional_bool(options, "include_tagged");
      config.skip_bundles = optional_bool(options, "skip_bundles");
      config.remove_empty_folders =
          optional_bool(options, "remove_empty_folders");
      config.create_dated_top_folder =
          optional_bool(options, "create_dated_top_folder");
      config.extra_logging = optional_bool(options, "extra_logging");
      if (options.contains("fallback_subfolder") &&
          options["fallback_subfolder"].is_string()) {
        config.fallback_subfolder = ensure_unix_subfolder(
            options["fallback_subfolder"].get<std::string>());
      }
    }

    if (raw.contains("rules") && raw["rules"].is_object()) {
      const json& rules = raw["rules"];
      for (const auto& [key, value] : rules.items()) {
        if (!value.is_array()) continue;
        if (key == "enable" || key == "disable") {
          auto& target =
              key == "enable" ? config.rules.enable : config.rules.disable;
          for (const auto& ref : value) {
            const std::string token = normalize_identifier(scalar_to_string(ref));
            if (auto it = aliases.find(token); it != aliases.end()) {
              target.insert(it->second);
            } else if (!token.empty()) {
              // Custom rules are only known after this section is read.
              target.insert(token.starts_with("custom_") ? token
                                                         : "custom_" + token);
            }
          }
        } else if (key == "order") {
          for (const auto& ref : value) {
            std::string id = resolve_rule_reference(aliases, scalar_to_string(ref));
            if (!id.empty()) config.rules.order.push_back(std::move(id));
          }
        } else {
          // Legacy form: "rules": {"pdf_documents": [".pdf"]}.
          std::vector<std::string> exts;
          for (const auto& ext : value) {
            exts.push_back(normalize_extension(scalar_to_string(ext)));
          }
          config.rules.extensions[resolve_rule_reference(aliases, key)] =
              std::move(exts);
        }
      }
    }

    if (raw.contains("extension_rules") && raw["extension_rules"].is_object()) {
      for (const auto& [key, value] : raw["extension_rules"].items()) {
        if (!value.is_array()) continue;
        std::vector<std::string> exts;
        for (const auto& ext : value) {
          exts.push_back(normalize_extension(scalar_to_string(ext)));
        }
        config.rules.extensions[resolve_rule_reference(aliases, key)] =
            std::move(exts);
      }
    }

    if (raw.contains("subfolders") && raw["subfolders"].is_object()) {
      for (const auto& [key, value] : raw["subfolders"].items()) {
        if (!value.is_string()) continue;
        config.rules.subfolders[resolve_rule_reference(aliases, key)] =
            ensure_unix_subfolder(value.get<std::string>());
      }
    }

    if (raw.contains("custom_rules")) {
      const json& custom = raw["custom_rules"];
      if (custom.is_object()) {
        for (const auto& [custom_id, custom_value] : custom.items()) {
          config.rules.custom_rules.push_back(
              parse_custom_rule(custom_id, custom_value));
        }
      } else if (custom.is_array()) {
        int index = 0;
        for (const auto& custom_value : custom) {
          ++index;
          if (!custom_value.is_object()) continue;
          const std::string raw_id =
              custom_value.contains("id")
                  ? scalar_to_string(custom_value["id"])
                  : std::format("rule_{}", index);
          config.rules.custom_rules.push_back(
              parse_custom_rule(raw_id, custom_value));
        }
      }
    }

    return config;
  } catch (const json::exception& e) {
    log(std::format("Error parsing config: {}", e.what()));
  } catch (const std::invalid_argument& e) {
    log(std::format("Error in config: {}", e.what()));
  } catch (const std::out_of_range& e) {
    log(std::format("Error in config: {}", e.what()));
  }
  return std::nullopt;
}

bool IOManager::write_json_file(const fs::path& path, const json& payload) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      log(std::format("Error: cannot create directory '{}': {}",
                      safe_path_to_string(path.parent_path()), ec.message()));
      return false;
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    log(std::format("Error: cannot open '{}' for writing",
                    safe_path_to_string(path)));
    return false;
  }
  out << payload.dump(2, ' ', true) << "\n";
  out.flush();
  if (!out) {
    log(std::format("Error: failed writing '{}'", safe_path_to_string(path)));
    return false;
  }
  return true;
}
