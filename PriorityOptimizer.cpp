#include "PriorityOptimizer.hpp"

#include <algorithm>
#include <cmath>

#include "utils.hpp"

namespace {
constexpr double kDisabledScore = -1'000'000.0;

double round3(double value) { return std::round(value * 1000.0) / 1000.0; }
}  // namespace

double condition_specificity_score(const Condition& condition) {
  switch (condition.type) {
    case ConditionType::EXTENSION_ANY: {
      const auto count = std::count_if(
          condition.values.begin(), condition.values.end(),
          [](const std::string& ext) { return !trim_ascii(ext).empty(); });
      return 120.0 / static_cast<double>(std::max<std::ptrdiff_t>(1, count));
    }
    case ConditionType::NAME_CONTAINS: {
      const auto useful = std::count_if(
          condition.values.begin(), condition.values.end(),
          [](const std::string& phrase) { return !trim_ascii(phrase).empty(); });
      return 70.0 + static_cast<double>(std::min<std::ptrdiff_t>(useful, 5)) * 4.0;
    }
    case ConditionType::CREATED_WITHIN_DAYS:
    case ConditionType::SIZE_GTE:
    case ConditionType::SIZE_LTE:
      return 45.0;
    case ConditionType::HAS_TAG:
    case ConditionType::IS_ALIAS:
    case ConditionType::IS_FOLDER:
      return 40.0;
    case ConditionType::KIND:
      return 35.0;
    case ConditionType::UNKNOWN:
      break;
  }
  return 0.0;
}

double rule_specificity_score(const Rule& rule) {
  if (!rule.enabled) return kDisabledScore;

  double score = 0.0;
  for (const auto& condition : rule.conditions) {
    score += condition_specificity_score(condition);
  }
  if (rule.mode == RuleMode::ALL) score += 12.0;
  if (!rule.built_in) score += 6.0;
  score += static_cast<double>(
               std::min<std::size_t>(rule.conditions.size(), 5)) *
           3.0;
  return score;
}

std::pair<std::vector<Rule>, PriorityOptimizationReport> optimize_rule_priority(
    const std::vector<Rule>& rules) {
  PriorityOptimizationReport report;
  report.enabled = true;
  for (const auto& rule : rules) report.before_order.push_back(rule.id);

  struct Scored {
    const Rule* rule;
    double score;
    int original_index;
  };
  std::vector<Scored> enabled;
  std::vector<const Rule*> disabled;
  for (int i = 0; i < static_cast<int>(rules.size()); ++i) {
    if (rules[i].enabled) {
      enabled.push_back({&rules[i], rule_specificity_score(rules[i]), i});
    } else {
      disabled.push_back(&rules[i]);
    }
  }

  std::stable_sort(enabled.begin(), enabled.end(),
                   [](const Scored& a, const Scored& b) {
                     return a.score > b.score;
                   });

  std::vector<Rule> optimized;
  optimized.reserve(rules.size());
  for (const auto& entry : enabled) optimized.push_back(*entry.rule);
  for (const Rule* rule : disabled) optimized.push_back(*rule);

  for (const auto& rule : optimized) report.after_order.push_back(rule.id);
  report.changed = report.before_order != report.after_order;

  for (int pos = 0; pos < static_cast<int>(enabled.size()); ++pos) {
    const auto& entry = enabled[pos];
    report.scores.push_back({entry.rule->id, entry.rule->description,
                             round3(entry.score), entry.original_index, pos});
  }
  return {std::move(optimized), std::move(report)};
}
