#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using TimePoint = std::chrono::system_clock::time_point;

enum class ConditionType {
  EXTENSION_ANY,
  NAME_CONTAINS,
  KIND,
  CREATED_WITHIN_DAYS,
  SIZE_GTE,
  SIZE_LTE,
  IS_FOLDER,
  IS_ALIAS,
  HAS_TAG,
  UNKNOWN
};
NLOHMANN_JSON_SERIALIZE_ENUM(
    ConditionType,
    {{ConditionType::UNKNOWN, "unknown"},
     {ConditionType::EXTENSION_ANY, "extension_any"},
     {ConditionType::NAME_CONTAINS, "name_contains"},
     {ConditionType::KIND, "kind"},
     {ConditionType::CREATED_WITHIN_DAYS, "created_within_days"},
     {ConditionType::SIZE_GTE, "size_gte"},
     {ConditionType::SIZE_LTE, "size_lte"},
     {ConditionType::IS_FOLDER, "is_folder"},
     {ConditionType::IS_ALIAS, "is_alias"},
     {ConditionType::HAS_TAG, "has_tag"}});

// One atomic predicate. Which payload field is meaningful depends on type:
// string lists for extension/name/kind, threshold for day and size limits,
// flag for the structural checks.
struct Condition {
  ConditionType type = ConditionType::UNKNOWN;
  std::vector<std::string> values;
  double threshold = 0.0;
  bool flag = true;
};

enum class RuleMode { ALL, ANY };
NLOHMANN_JSON_SERIALIZE_ENUM(RuleMode,
                             {{RuleMode::ALL, "all"}, {RuleMode::ANY, "any"}});

struct Rule {
  std::string id;
  std::string description;
  std::string subfolder;
  bool enabled = true;
  bool built_in = false;
  RuleMode mode = RuleMode::ALL;
  std::vector<Condition> conditions;
};

using KindTable = std::map<std::string, std::set<std::string>>;

struct RuleOverrides {
  std::map<std::string, std::vector<std::string>> extensions;
  std::map<std::string, std::string> subfolders;
  std::set<std::string> enable;
  std::set<std::string> disable;
  std::vector<std::string> order;
  std::vector<Rule> custom_rules;
};

// Already-validated configuration handed to the core. Unset booleans fall
// back to the command line or the built-in defaults.
struct Config {
  RuleOverrides rules;
  std::set<std::string> ignore_extensions;
  std::set<std::string> ignore_paths;
  std::optional<bool> ignore_aliases;
  std::optional<bool> ignore_folders;
  std::optional<bool> ignore_tagged;
  std::optional<bool> include_subfolders;
  std::optional<bool> include_folders;
  std::optional<bool> include_empty_folders;
  std::optional<bool> include_tagged;
  std::optional<bool> skip_bundles;
  std::optional<bool> remove_empty_folders;
  std::optional<bool> create_dated_top_folder;
  std::optional<bool> extra_logging;
  std::optional<std::string> fallback_subfolder;
};

struct ScanOptions {
  bool include_subfolders = false;
  bool include_folders = false;
  bool include_empty_folders = false;
  bool include_tagged = false;
  bool ignore_tagged = false;
  bool ignore_aliases = false;
  bool ignore_folders = false;
  bool skip_bundles = true;
  bool extra_logging = false;
  std::set<std::string> ignore_extensions;
  std::set<std::string> ignore_paths;
  std::vector<fs::path> excluded_roots;
};

struct Item {
  fs::path path;
  fs::path relative_path;
  std::string name;
  bool is_directory = false;
  bool is_symlink = false;
  std::uintmax_t size_bytes = 0;
  TimePoint modified_at{};
  bool has_tag = false;
};

struct MovePlanEntry {
  fs::path source;
  fs::path destination;
  std::string rule_id;
  std::string rule_description;
  bool collision_renamed = false;
};

struct Summary {
  int scanned = 0;
  int ignored = 0;
  int total_targets = 0;
  int matched = 0;
  int unclassified = 0;
  int fallback = 0;
  std::map<std::string, int> rule_hits;
  int planned_moves = 0;
  int moved = 0;
  int collisions = 0;
  int errors = 0;
  int rules_used = 0;
};

struct RuleScore {
  std::string rule_id;
  std::string description;
  double score = 0.0;
  int original_index = 0;
  int optimized_index = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RuleScore, rule_id, description, score,
                                   original_index, optimized_index);

struct PriorityOptimizationReport {
  bool enabled = false;
  std::string strategy = "specificity_v1";
  bool changed = false;
  std::vector<std::string> before_order;
  std::vector<std::string> after_order;
  std::vector<RuleScore> scores;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PriorityOptimizationReport, enabled,
                                   strategy, changed, before_order,
                                   after_order, scores);

struct MoveRecord {
  fs::path from;
  fs::path to;
  std::string rule_id;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MoveRecord, from, to, rule_id);

struct TransactionRecord {
  std::string id;
  std::string created_at;
  fs::path source_dir;
  fs::path destination_dir;
  std::vector<MoveRecord> moves;
  std::vector<fs::path> removed_empty_dirs;
  std::optional<std::string> undone_at;
};

inline void to_json(json& j, const TransactionRecord& r) {
  j = json{{"id", r.id},
           {"created_at", r.created_at},
           {"source_dir", r.source_dir},
           {"destination_dir", r.destination_dir},
           {"moves", r.moves},
           {"removed_empty_dirs", r.removed_empty_dirs},
           {"undone_at", nullptr}};
  if (r.undone_at) {
    j["undone_at"] = *r.undone_at;
  }
}

// Throws json::exception (type_error) on a malformed record, in particular
// when "moves" is not an array.
inline void from_json(const json& j, TransactionRecord& r) {
  j.at("id").get_to(r.id);
  r.created_at = j.value("created_at", std::string{});
  r.source_dir = j.value("source_dir", std::string{});
  r.destination_dir = j.value("destination_dir", std::string{});
  j.at("moves").get_to(r.moves);
  if (j.contains("removed_empty_dirs") && j["removed_empty_dirs"].is_array()) {
    j["removed_empty_dirs"].get_to(r.removed_empty_dirs);
  }
  r.undone_at.reset();
  if (j.contains("undone_at") && j["undone_at"].is_string()) {
    r.undone_at = j["undone_at"].get<std::string>();
  }
}

// A record as found in the undo directory. A file that does not hold a valid
// record keeps whatever identifies it and the reason it was rejected.
struct StoredTransaction {
  fs::path file;
  TransactionRecord record;
  std::optional<std::string> load_error;
};

struct UndoResult {
  int restored = 0;
  int collisions = 0;
  int errors = 0;
};

struct OrganizerError {
  enum class Kind { FATAL, RECOVERABLE };
  Kind kind = Kind::FATAL;
  std::string message;
};
