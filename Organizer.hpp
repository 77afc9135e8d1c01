#pragma once

#include <expected>
#include <optional>

#include "RuleEngine.hpp"
#include "types.hpp"

struct TidyOptions {
  std::optional<fs::path> source;
  std::optional<fs::path> destination;
  std::optional<fs::path> config_path;
  fs::path undo_dir;
  bool apply = false;

  // Each flag is OR-ed with the matching config value.
  bool include_subfolders = false;
  bool include_folders = false;
  bool include_empty_folders = false;
  bool include_tagged = false;
  bool ignore_tagged = false;
  bool ignore_aliases = false;
  bool ignore_folders = false;
  bool skip_bundles = false;
  bool remove_empty_folders = false;
  bool create_dated_top_folder = false;
  bool extra_logging = false;
  bool optimize_priority = false;

  std::vector<std::string> ignore_extensions;
  std::vector<std::string> ignore_paths;
  std::optional<fs::path> stats_json;

  // Reference time for created_within_days; defaults to the start of the run.
  std::optional<TimePoint> reference_time;
};

struct RuleSet {
  Config config;
  std::vector<Rule> rules;
};

struct TidyReport {
  bool apply = false;
  fs::path source_dir;
  fs::path destination_dir;
  std::vector<Rule> rules;
  PriorityOptimizationReport priority;
  std::vector<MovePlanEntry> plan;
  Summary summary;
  std::vector<fs::path> removed_empty_dirs;
  std::optional<TransactionRecord> transaction;
};

inline const std::set<std::string>& default_ignore_extensions() {
  static const std::set<std::string> extensions = {
      ".crdownload", ".part", ".partial", ".download",
      ".opdownload", ".!qb",  ".tmp"};
  return extensions;
}

// Built-in rules with the config file's overrides applied. Without a path the
// built-in table is returned unchanged.
std::expected<RuleSet, OrganizerError> resolve_rules(
    const std::optional<fs::path>& config_path);

// Scan, plan, execute (or simulate), clean up, record, and report. Fatal
// preconditions come back as an error; per-move failures are counted in
// TidyReport::summary.errors.
std::expected<TidyReport, OrganizerError> run_tidy(const TidyOptions& options);

json build_rule_hit_report(const std::vector<Rule>& rules,
                           const Summary& summary);
json build_stats_payload(const TidyReport& report);
