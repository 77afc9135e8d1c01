#include "Organizer.hpp"

#include <format>

#include "Executor.hpp"
#include "IOManager.hpp"
#include "ItemScanner.hpp"
#include "PriorityOptimizer.hpp"
#include "RuleCatalog.hpp"
#include "TagProbe.hpp"
#include "TransactionStore.hpp"
#include "utils.hpp"

namespace {
OrganizerError fatal(std::string message) {
  return OrganizerError{OrganizerError::Kind::FATAL, std::move(message)};
}

fs::path resolve_directory(const fs::path& p) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(p, ec);
  if (ec) {
    resolved = fs::absolute(p, ec);
  }
  return resolved.lexically_normal();
}

fs::path dated_run_folder(const fs::path& destination) {
  const auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  const std::chrono::zoned_time local{std::chrono::current_zone(), now};
  return destination / std::format("{:%Y-%m-%d_%H-%M-%S}", local);
}

// Category folders live directly in the source when both roots coincide;
// only those (never the whole source) are kept out of the scan.
std::vector<fs::path> category_roots(
    const fs::path& run_destination, const std::vector<Rule>& rules,
    const std::optional<std::string>& fallback) {
  std::set<fs::path> roots;
  const auto add = [&](const std::string& subfolder) {
    const fs::path relative = path_from_utf8(subfolder);
    if (relative.empty()) return;
    roots.insert(run_destination / *relative.begin());
  };
  for (const auto& rule : rules) {
    if (rule.enabled) add(rule.subfolder);
  }
  if (fallback) add(*fallback);
  return {roots.begin(), roots.end()};
}

std::string join_ids(const std::vector<std::string>& ids) {
  std::string joined;
  for (const auto& id : ids) {
    if (!joined.empty()) joined += ',';
    joined += id;
  }
  return joined;
}

void log_run_summary(const TidyReport& report) {
  const Summary& s = report.summary;
  IOManager::log(std::format(
      "SUMMARY scanned={} ignored={} matched={} planned={} moved={} "
      "collisions={} errors={} rules_used={}",
      s.scanned, s.ignored, s.matched, s.planned_moves, s.moved, s.collisions,
      s.errors, s.rules_used));
  IOManager::log(std::format("REPORT total_targets={} unclassified={} "
                             "fallback={}",
                             s.total_targets, s.unclassified, s.fallback));

  std::string hits;
  for (const auto& rule : report.rules) {
    if (!rule.enabled) continue;
    auto it = s.rule_hits.find(rule.id);
    if (it == s.rule_hits.end() || it->second == 0) continue;
    if (!hits.empty()) hits += ", ";
    hits += std::format("{}:{}", rule.id, it->second);
  }
  if (auto it = s.rule_hits.find(RuleEngine::kFallbackRuleId);
      it != s.rule_hits.end()) {
    if (!hits.empty()) hits += ", ";
    hits += std::format("{}:{}", it->first, it->second);
  }
  IOManager::log(hits.empty() ? std::string("RULE_HITS (none)")
                              : std::format("RULE_HITS {}", hits));
}
}  // namespace

std::expected<RuleSet, OrganizerError> resolve_rules(
    const std::optional<fs::path>& config_path) {
  const auto& base = built_in_rules();
  RuleSet result;
  if (config_path) {
    auto config = IOManager::load_config(*config_path, base);
    if (!config) {
      return std::unexpected(fatal(std::format(
          "failed to load config '{}'", safe_path_to_string(*config_path))));
    }
    result.config = std::move(*config);
  }
  try {
    result.rules = apply_rule_overrides(base, result.config.rules);
  } catch (const std::invalid_argument& e) {
    return std::unexpected(fatal(std::format("invalid rule override: {}",
                                             e.what())));
  }
  return result;
}

std::expected<TidyReport, OrganizerError> run_tidy(const TidyOptions& options) {
  auto rule_set = resolve_rules(options.config_path);
  if (!rule_set) {
    return std::unexpected(rule_set.error());
  }
  const Config& config = rule_set->config;

  std::optional<fs::path> source_hint = options.source;
  if (!source_hint) {
    source_hint = IOManager::get_downloads_folder_path();
  }
  if (!source_hint) {
    return std::unexpected(fatal("could not locate the Downloads folder"));
  }
  std::error_code ec;
  if (!fs::is_directory(*source_hint, ec)) {
    return std::unexpected(fatal(std::format(
        "source directory not found: {}", safe_path_to_string(*source_hint))));
  }

  TidyReport report;
  report.apply = options.apply;
  report.source_dir = resolve_directory(*source_hint);
  const fs::path destination =
      options.destination ? resolve_directory(*options.destination)
                          : report.source_dir;

  if (!fs::exists(destination, ec)) {
    if (options.apply) {
      fs::create_directories(destination, ec);
      if (ec) {
        return std::unexpected(fatal(
            std::format("cannot create destination '{}': {}",
                        safe_path_to_string(destination), ec.message())));
      }
    } else {
      IOManager::log(std::format(
          "Destination directory will be created when applying: '{}'",
          safe_path_to_string(destination)));
    }
  }

  report.rules = std::move(rule_set->rules);
  for (const auto& rule : report.rules) {
    report.priority.before_order.push_back(rule.id);
  }
  report.priority.after_order = report.priority.before_order;
  if (options.optimize_priority) {
    auto [optimized, optimization] = optimize_rule_priority(report.rules);
    report.rules = std::move(optimized);
    report.priority = std::move(optimization);
    IOManager::log(std::format("OPTIMIZE_PRIORITY enabled={} changed={} "
                               "strategy={}",
                               report.priority.enabled,
                               report.priority.changed,
                               report.priority.strategy));
    IOManager::log(std::format("OPTIMIZE_ORDER before={}",
                               join_ids(report.priority.before_order)));
    IOManager::log(std::format("OPTIMIZE_ORDER after={}",
                               join_ids(report.priority.after_order)));
  }

  ScanOptions scan_options;
  scan_options.include_subfolders =
      options.include_subfolders || config.include_subfolders.value_or(false);
  scan_options.include_folders =
      options.include_folders || config.include_folders.value_or(false);
  scan_options.include_empty_folders =
      options.include_empty_folders ||
      config.include_empty_folders.value_or(false);
  scan_options.include_tagged =
      options.include_tagged || config.include_tagged.value_or(false);
  scan_options.ignore_tagged =
      options.ignore_tagged || config.ignore_tagged.value_or(false);
  scan_options.ignore_aliases =
      options.ignore_aliases || config.ignore_aliases.value_or(false);
  scan_options.ignore_folders =
      options.ignore_folders || config.ignore_folders.value_or(false);
  scan_options.skip_bundles =
      options.skip_bundles || config.skip_bundles.value_or(true);
  scan_options.extra_logging =
      options.extra_logging || config.extra_logging.value_or(false);
  const bool remove_empty_folders =
      options.remove_empty_folders ||
      config.remove_empty_folders.value_or(false);
  const bool create_dated_top_folder =
      options.create_dated_top_folder ||
      config.create_dated_top_folder.value_or(false);

  scan_options.ignore_extensions = default_ignore_extensions();
  scan_options.ignore_extensions.insert(config.ignore_extensions.begin(),
                                        config.ignore_extensions.end());
  scan_options.ignore_paths = config.ignore_paths;
  try {
    for (const auto& ext : options.ignore_extensions) {
      scan_options.ignore_extensions.insert(normalize_extension(ext));
    }
  } catch (const std::invalid_argument& e) {
    return std::unexpected(fatal(std::format("--ignore-ext: {}", e.what())));
  }
  for (const auto& raw : options.ignore_paths) {
    std::string token = string_to_lower_ascii(trim_ascii(raw));
    if (!token.empty()) scan_options.ignore_paths.insert(std::move(token));
  }

  report.destination_dir = destination;
  if (create_dated_top_folder) {
    report.destination_dir = dated_run_folder(destination);
    if (options.apply) {
      fs::create_directories(report.destination_dir, ec);
      if (ec) {
        return std::unexpected(fatal(
            std::format("cannot create '{}': {}",
                        safe_path_to_string(report.destination_dir),
                        ec.message())));
      }
    }
  }

  if (report.destination_dir == report.source_dir) {
    scan_options.excluded_roots = category_roots(
        report.destination_dir, report.rules, config.fallback_subfolder);
  } else {
    scan_options.excluded_roots = {report.destination_dir};
  }
  const std::vector<fs::path> excluded_roots = scan_options.excluded_roots;

  IOManager::log(std::format("{}: '{}' -> '{}'",
                             options.apply ? "APPLY" : "DRY-RUN",
                             safe_path_to_string(report.source_dir),
                             safe_path_to_string(report.destination_dir)));

  const auto tag_probe = make_platform_tag_probe();
  const ItemScanner scanner(std::move(scan_options), *tag_probe);
  const ScanResult scan = scanner.scan(report.source_dir);

  RuleEngine engine(report.rules, built_in_kind_table(),
                    options.reference_time.value_or(
                        std::chrono::system_clock::now()));
  engine.set_fallback_subfolder(config.fallback_subfolder);
  PlanResult planned = engine.generate_plan(scan, report.destination_dir);
  report.plan = std::move(planned.plan);
  report.summary = std::move(planned.summary);

  const Executor executor(options.apply);
  ExecutionResult executed = executor.execute(report.plan);
  report.summary.errors += executed.errors;
  report.summary.moved = static_cast<int>(executed.executed.size());

  if (options.apply && remove_empty_folders) {
    report.removed_empty_dirs =
        remove_empty_dirs(report.source_dir, excluded_roots);
  }

  if (options.apply && !executed.executed.empty()) {
    TransactionStore store(options.undo_dir);
    auto recorded =
        store.record(report.source_dir, report.destination_dir,
                     std::move(executed.executed), report.removed_empty_dirs);
    if (recorded) {
      report.transaction = std::move(*recorded);
    } else {
      ++report.summary.errors;
      IOManager::log(std::format("ERROR: {}", recorded.error().message));
    }
  }

  log_run_summary(report);

  if (options.stats_json) {
    if (IOManager::write_json_file(*options.stats_json,
                                   build_stats_payload(report))) {
      IOManager::log(std::format("STATS JSON: '{}'",
                                 safe_path_to_string(*options.stats_json)));
    } else {
      ++report.summary.errors;
    }
  }
  return report;
}

json build_rule_hit_report(const std::vector<Rule>& rules,
                           const Summary& summary) {
  json report = json::array();
  for (const auto& rule : rules) {
    if (!rule.enabled) continue;
    const auto it = summary.rule_hits.find(rule.id);
    report.push_back({{"rule_id", rule.id},
                      {"description", rule.description},
                      {"subfolder", rule.subfolder},
                      {"hits", it == summary.rule_hits.end() ? 0 : it->second},
                      {"built_in", rule.built_in},
                      {"enabled", rule.enabled}});
  }
  return report;
}

json build_stats_payload(const TidyReport& report) {
  const Summary& s = report.summary;
  const json rule_hits = build_rule_hit_report(report.rules, s);
  json nonzero = json::object();
  for (const auto& entry : rule_hits) {
    if (entry["hits"].get<int>() > 0) {
      nonzero[entry["rule_id"].get<std::string>()] = entry["hits"];
    }
  }
  if (auto it = s.rule_hits.find(RuleEngine::kFallbackRuleId);
      it != s.rule_hits.end()) {
    nonzero[it->first] = it->second;
  }

  return json{
      {"generated_at", format_iso8601(std::chrono::system_clock::now())},
      {"mode", report.apply ? "apply" : "dry-run"},
      {"source_dir", safe_path_to_string(report.source_dir)},
      {"destination_dir", safe_path_to_string(report.destination_dir)},
      {"total_targets", s.total_targets},
      {"rule_hits", rule_hits},
      {"rule_hits_nonzero", nonzero},
      {"unclassified", s.unclassified},
      {"fallback", s.fallback},
      {"priority_optimization", report.priority},
      {"summary",
       {{"scanned", s.scanned},
        {"ignored", s.ignored},
        {"matched", s.matched},
        {"planned_moves", s.planned_moves},
        {"moved", s.moved},
        {"collisions", s.collisions},
        {"errors", s.errors},
        {"rules_used", s.rules_used}}}};
}
