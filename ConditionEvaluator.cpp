#include "ConditionEvaluator.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

#include "utils.hpp"

namespace {
bool eval_extension_any(const Condition& c, const Item& item) {
  return !item.is_directory && matches_extension(item.name, c.values);
}

bool eval_name_contains(const Condition& c, const Item& item) {
  const std::string lower_name = string_to_lower_ascii(item.name);
  return std::any_of(c.values.begin(), c.values.end(),
                     [&](const std::string& phrase) {
                       return lower_name.find(string_to_lower_ascii(phrase)) !=
                              std::string::npos;
                     });
}

bool eval_kind(const Condition& c, const Item& item, const KindTable& kinds) {
  if (c.values.size() != 1) return false;
  const std::string kind = normalize_identifier(c.values.front());
  if (kind == "folder") return item.is_directory;
  if (kind == "alias" || kind == "symlink") return item.is_symlink;
  auto it = kinds.find(kind);
  if (it == kinds.end()) return false;
  return !item.is_directory && matches_extension(item.name, it->second);
}

bool eval_created_within_days(const Condition& c, const Item& item,
                              TimePoint reference_time) {
  // Floating-point seconds, so no finite window can overflow the clock.
  using Seconds = std::chrono::duration<double>;
  const double cutoff =
      Seconds(reference_time.time_since_epoch()).count() - c.threshold * 86400.0;
  return Seconds(item.modified_at.time_since_epoch()).count() >= cutoff;
}

std::uintmax_t size_threshold(const Condition& c) {
  constexpr std::uintmax_t kLargest = std::numeric_limits<std::uintmax_t>::max();
  if (!(c.threshold > 0.0)) return 0;
  if (c.threshold >= static_cast<double>(kLargest)) return kLargest;
  return static_cast<std::uintmax_t>(c.threshold);
}
}  // namespace

bool evaluate_condition(const Condition& condition, const Item& item,
                        TimePoint reference_time, const KindTable& kinds) {
  switch (condition.type) {
    case ConditionType::EXTENSION_ANY:
      return eval_extension_any(condition, item);
    case ConditionType::NAME_CONTAINS:
      return eval_name_contains(condition, item);
    case ConditionType::KIND:
      return eval_kind(condition, item, kinds);
    case ConditionType::CREATED_WITHIN_DAYS:
      return eval_created_within_days(condition, item, reference_time);
    case ConditionType::SIZE_GTE:
      return item.size_bytes >= size_threshold(condition);
    case ConditionType::SIZE_LTE:
      if (condition.threshold < 0.0) return false;
      return item.size_bytes <= size_threshold(condition);
    case ConditionType::IS_FOLDER:
      return item.is_directory == condition.flag;
    case ConditionType::IS_ALIAS:
      return item.is_symlink == condition.flag;
    case ConditionType::HAS_TAG:
      return item.has_tag == condition.flag;
    case ConditionType::UNKNOWN:
      break;
  }
  return false;
}

bool matches_rule(const Rule& rule, const Item& item, TimePoint reference_time,
                  const KindTable& kinds) {
  if (!rule.enabled || rule.conditions.empty()) return false;
  const auto check = [&](const Condition& c) {
    return evaluate_condition(c, item, reference_time, kinds);
  };
  if (rule.mode == RuleMode::ANY) {
    return std::any_of(rule.conditions.begin(), rule.conditions.end(), check);
  }
  return std::all_of(rule.conditions.begin(), rule.conditions.end(), check);
}
