#include "RuleCatalog.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "utils.hpp"

namespace {
Condition flag_condition(ConditionType type) {
  Condition c;
  c.type = type;
  c.flag = true;
  return c;
}

Condition kind_condition(std::string_view kind) {
  Condition c;
  c.type = ConditionType::KIND;
  c.values.push_back(string_to_lower_ascii(trim_ascii(kind)));
  return c;
}

Condition name_condition(std::vector<std::string> phrases) {
  Condition c;
  c.type = ConditionType::NAME_CONTAINS;
  c.values = std::move(phrases);
  return c;
}

Rule ext_rule(std::string_view id, std::string_view description,
              std::string_view subfolder,
              const std::vector<std::string>& extensions) {
  return make_rule(id, description, subfolder, true, true, RuleMode::ALL,
                   {extension_condition(extensions)});
}

const std::vector<std::string> kImageExtensions = {
    ".png", ".jpg", ".jpeg", ".gif",  ".webp", ".svg", ".avif",
    ".bmp", ".heic", ".tif", ".tiff", ".ico",  ".jfif"};
const std::vector<std::string> kAudioExtensions = {
    ".mp3", ".wav", ".m4a", ".aac", ".flac", ".ogg", ".opus", ".aif", ".aiff"};
const std::vector<std::string> kVideoExtensions = {
    ".mp4", ".mov", ".mkv", ".avi", ".wmv", ".webm", ".m4v", ".ts", ".mts"};
const std::vector<std::string> kArchiveExtensions = {
    ".zip", ".rar", ".7z", ".tar", ".gz", ".tar.gz",
    ".tgz", ".bz2", ".xz", ".zst", ".cab"};
const std::vector<std::string> kCodeExtensions = {
    ".py",   ".js",   ".ts",    ".tsx",  ".jsx",  ".java", ".c",    ".cpp",
    ".h",    ".hpp",  ".go",    ".rs",   ".rb",   ".php",  ".swift", ".kt",
    ".json", ".sql",  ".ini",   ".cfg",  ".conf", ".toml", ".yaml", ".yml",
    ".xml",  ".html", ".css",   ".scss", ".sh",   ".zsh"};

std::vector<Rule> build_built_in_rules() {
  std::vector<Rule> rules;
  rules.reserve(22);
  rules.push_back(make_rule("aliases", "Aliases", "Aliases", false, true,
                            RuleMode::ALL,
                            {flag_condition(ConditionType::IS_ALIAS)}));
  rules.push_back(make_rule("folders", "Folders", "Folders", false, true,
                            RuleMode::ALL,
                            {flag_condition(ConditionType::IS_FOLDER)}));
  rules.push_back(make_rule(
      "screenshots", "Screenshots", "Screenshots", true, true, RuleMode::ALL,
      {kind_condition("image"),
       // The third phrase is "screenshot" in Japanese (UTF-8).
       name_condition({"screenshot", "screen shot",
                       "\xe3\x82\xb9\xe3\x82\xaf\xe3\x83\xaa\xe3\x83\xbc\xe3"
                       "\x83\xb3\xe3\x82\xb7\xe3\x83\xa7\xe3\x83\x83\xe3\x83"
                       "\x88"})}));
  rules.push_back(ext_rule("png_images", "PNG Images", "Images/PNG", {".png"}));
  rules.push_back(ext_rule("jpeg_images", "JPEG Images", "Images/JPEG",
                           {".jpg", ".jpeg"}));
  rules.push_back(ext_rule("gif_images", "GIF Images", "Images/GIF", {".gif"}));
  rules.push_back(ext_rule("web_images", "Web Images", "Images/Web",
                           {".webp", ".svg", ".avif"}));
  rules.push_back(
      ext_rule("other_images", "Other Images", "Images/Other",
               {".bmp", ".heic", ".tif", ".tiff", ".ico", ".jfif"}));
  rules.push_back(
      ext_rule("pdf_documents", "PDF Documents", "Documents/PDF", {".pdf"}));
  rules.push_back(
      ext_rule("word_documents", "Word Documents", "Documents/Word",
               {".doc", ".docx", ".odt", ".pages", ".rtf", ".epub"}));
  rules.push_back(ext_rule("plain_text", "Plain Text", "Documents/Text",
                           {".txt", ".text"}));
  rules.push_back(ext_rule("markdown", "Markdown", "Documents/Markdown",
                           {".md", ".markdown"}));
  rules.push_back(
      ext_rule("spreadsheets", "Spreadsheets", "Documents/Spreadsheets",
               {".xls", ".xlsx", ".csv", ".tsv", ".ods", ".numbers"}));
  rules.push_back(
      ext_rule("presentations", "Presentations", "Documents/Presentations",
               {".ppt", ".pptx", ".pps", ".ppsx", ".key", ".odp"}));
  rules.push_back(ext_rule("code", "Code", "Code", kCodeExtensions));
  rules.push_back(ext_rule("audio", "Audio", "Audio", kAudioExtensions));
  rules.push_back(ext_rule("videos", "Videos", "Videos", kVideoExtensions));
  rules.push_back(
      ext_rule("archives", "Archives", "Archives", kArchiveExtensions));
  rules.push_back(ext_rule("disk_images", "Disk Images", "Disk Images",
                           {".dmg", ".iso", ".img"}));
  rules.push_back(
      ext_rule("installers", "Installers", "Installers",
               {".pkg", ".msi", ".exe", ".deb", ".rpm", ".apk"}));
  rules.push_back(ext_rule("fonts", "Fonts", "Fonts",
                           {".ttf", ".ttc", ".otf", ".woff", ".woff2"}));
  rules.push_back(ext_rule("torrents", "Torrents", "Torrents", {".torrent"}));
  return rules;
}

KindTable build_kind_table() {
  const auto as_set = [](const std::vector<std::string>& v) {
    return std::set<std::string>(v.begin(), v.end());
  };
  return KindTable{
      {"image", as_set(kImageExtensions)},
      {"image_png", {".png"}},
      {"document",
       {".pdf", ".doc", ".docx", ".odt", ".pages", ".txt", ".rtf", ".md",
        ".markdown", ".epub"}},
      {"audio", as_set(kAudioExtensions)},
      {"video", as_set(kVideoExtensions)},
      {"archive", as_set(kArchiveExtensions)},
      {"code", as_set(kCodeExtensions)},
  };
}
}  // namespace

const std::vector<Rule>& built_in_rules() {
  static const std::vector<Rule> rules = build_built_in_rules();
  return rules;
}

const KindTable& built_in_kind_table() {
  static const KindTable table = build_kind_table();
  return table;
}

ConditionType parse_condition_type(std::string_view type_name) {
  static const std::unordered_map<std::string, ConditionType> types = {
      {"extension_any", ConditionType::EXTENSION_ANY},
      {"name_contains", ConditionType::NAME_CONTAINS},
      {"kind", ConditionType::KIND},
      {"created_within_days", ConditionType::CREATED_WITHIN_DAYS},
      {"size_gte", ConditionType::SIZE_GTE},
      {"size_lte", ConditionType::SIZE_LTE},
      {"is_folder", ConditionType::IS_FOLDER},
      {"is_alias", ConditionType::IS_ALIAS},
      {"has_tag", ConditionType::HAS_TAG}};
  if (auto it = types.find(normalize_identifier(type_name));
      it != types.end()) {
    return it->second;
  }
  return ConditionType::UNKNOWN;
}

Condition extension_condition(const std::vector<std::string>& extensions) {
  Condition c;
  c.type = ConditionType::EXTENSION_ANY;
  c.values.reserve(extensions.size());
  for (const auto& ext : extensions) {
    c.values.push_back(normalize_extension(ext));
  }
  return c;
}

Rule make_rule(std::string_view id, std::string_view description,
               std::string_view subfolder, bool enabled, bool built_in,
               RuleMode mode, std::vector<Condition> conditions) {
  Rule rule;
  rule.id = normalize_identifier(id);
  if (rule.id.empty()) {
    throw std::invalid_argument(
        std::format("rule id '{}' normalizes to nothing", id));
  }
  rule.description = trim_ascii(description);
  rule.subfolder = ensure_unix_subfolder(subfolder);
  rule.enabled = enabled;
  rule.built_in = built_in;
  rule.mode = mode;
  rule.conditions = std::move(conditions);
  return rule;
}

Rule make_custom_rule(std::string_view id, std::string_view description,
                      std::string_view subfolder, bool enabled, RuleMode mode,
                      std::vector<Condition> conditions) {
  if (conditions.empty()) {
    throw std::invalid_argument(std::format(
        "custom rule '{}' must define at least one condition", id));
  }
  return make_rule(std::format("custom_{}", id), description, subfolder,
                   enabled, false, mode, std::move(conditions));
}

std::map<std::string, std::string> rule_reference_aliases(
    const std::vector<Rule>& rules) {
  std::map<std::string, std::string> aliases;
  for (const auto& rule : rules) {
    aliases[rule.id] = rule.id;
    aliases[normalize_identifier(rule.description)] = rule.id;
    aliases[normalize_identifier(rule.subfolder)] = rule.id;
  }
  return aliases;
}

std::vector<Rule> apply_rule_overrides(const std::vector<Rule>& base,
                                       const RuleOverrides& overrides) {
  std::vector<Rule> updated;
  updated.reserve(base.size() + overrides.custom_rules.size());
  for (const auto& rule : base) {
    Rule copy = rule;
    if (auto it = overrides.subfolders.find(copy.id);
        it != overrides.subfolders.end()) {
      copy.subfolder = ensure_unix_subfolder(it->second);
    }
    if (auto it = overrides.extensions.find(copy.id);
        it != overrides.extensions.end()) {
      copy.conditions = {extension_condition(it->second)};
    }
    if (overrides.enable.contains(copy.id)) copy.enabled = true;
    if (overrides.disable.contains(copy.id)) copy.enabled = false;
    updated.push_back(std::move(copy));
  }

  // A custom rule reusing an earlier id replaces it in place.
  for (const auto& custom : overrides.custom_rules) {
    auto existing = std::find_if(
        updated.begin(), updated.end(),
        [&](const Rule& r) { return r.id == custom.id; });
    Rule copy = custom;
    if (overrides.enable.contains(copy.id)) copy.enabled = true;
    if (overrides.disable.contains(copy.id)) copy.enabled = false;
    if (existing != updated.end()) {
      *existing = std::move(copy);
    } else {
      updated.push_back(std::move(copy));
    }
  }

  if (overrides.order.empty()) {
    return updated;
  }

  std::vector<Rule> ordered;
  ordered.reserve(updated.size());
  std::unordered_set<std::string> used;
  for (const auto& id : overrides.order) {
    if (used.contains(id)) continue;
    auto it = std::find_if(updated.begin(), updated.end(),
                           [&](const Rule& r) { return r.id == id; });
    if (it == updated.end()) continue;
    ordered.push_back(*it);
    used.insert(id);
  }
  for (const auto& rule : updated) {
    if (!used.contains(rule.id)) ordered.push_back(rule);
  }
  return ordered;
}
