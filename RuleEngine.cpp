#include "RuleEngine.hpp"

#include <algorithm>
#include <format>
#include <set>

#include "ConditionEvaluator.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

namespace {
int path_depth(const fs::path& relative) {
  int depth = 0;
  for (auto it = relative.begin(); it != relative.end(); ++it) ++depth;
  return depth;
}
}  // namespace

RuleEngine::RuleEngine(std::vector<Rule> rules, const KindTable& kinds,
                       TimePoint reference_time)
    : m_rules(std::move(rules)),
      m_kinds(kinds),
      m_reference_time(reference_time) {}

void RuleEngine::set_fallback_subfolder(std::optional<std::string> subfolder) {
  m_fallback_subfolder = std::move(subfolder);
}

const Rule* RuleEngine::match(const Item& item) const {
  for (const auto& rule : m_rules) {
    if (matches_rule(rule, item, m_reference_time, m_kinds)) {
      return &rule;
    }
  }
  return nullptr;
}

PlanResult RuleEngine::generate_plan(const ScanResult& scan,
                                     const fs::path& destination) const {
  IOManager::log(std::format("Analyzing {} items ({} ignored)...",
                             scan.items.size(), scan.ignored));

  PlanResult result;
  Summary& summary = result.summary;
  summary.ignored = scan.ignored;
  summary.scanned = static_cast<int>(scan.items.size());
  summary.total_targets = summary.scanned;

  // Deepest entries first so a folder is never moved before the entries
  // inside it have been assigned.
  std::vector<const Item*> ordered;
  ordered.reserve(scan.items.size());
  for (const auto& item : scan.items) ordered.push_back(&item);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const Item* a, const Item* b) {
                     const int da = path_depth(a->relative_path);
                     const int db = path_depth(b->relative_path);
                     if (da != db) return da > db;
                     return string_to_lower_ascii(a->name) >
                            string_to_lower_ascii(b->name);
                   });

  std::set<fs::path> claimed;
  std::set<std::string> used_rules;

  for (const Item* item : ordered) {
    const Rule* rule = match(*item);
    std::string rule_id;
    std::string rule_description;
    std::string subfolder;

    if (rule) {
      rule_id = rule->id;
      rule_description = rule->description;
      subfolder = rule->subfolder;
    } else if (m_fallback_subfolder) {
      rule_id = kFallbackRuleId;
      rule_description = "Fallback";
      subfolder = *m_fallback_subfolder;
      ++summary.fallback;
    } else {
      ++summary.unclassified;
      IOManager::log_debug(std::format("No matching rule for '{}', leaving in "
                                       "place.",
                                       safe_path_to_string(item->path)));
      continue;
    }

    ++summary.matched;
    ++summary.rule_hits[rule_id];
    used_rules.insert(rule_id);

    const fs::path target =
        destination / path_from_utf8(subfolder) / item->path.filename();
    auto [final_target, renamed] = generate_unique_path(target, claimed);
    claimed.insert(final_target);
    if (renamed) {
      ++summary.collisions;
      IOManager::log_debug(std::format("Collision: '{}' renamed to '{}'",
                                       safe_path_to_string(target),
                                       safe_path_to_string(final_target)));
    }

    result.plan.push_back(MovePlanEntry{item->path, final_target, rule_id,
                                        rule_description, renamed});
  }

  summary.planned_moves = static_cast<int>(result.plan.size());
  summary.rules_used = static_cast<int>(used_rules.size());

  IOManager::log(std::format("Analysis complete. {} moves planned, {} "
                             "unclassified.",
                             summary.planned_moves, summary.unclassified));
  return result;
}
