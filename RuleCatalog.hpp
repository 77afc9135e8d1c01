#pragma once

#include <map>
#include <string_view>

#include "types.hpp"

// The shipped rule table. Built once on first use and never mutated;
// apply_rule_overrides always returns a new list.
const std::vector<Rule>& built_in_rules();

// Symbolic kinds ("image", "document", ...) used by the "kind" condition.
const KindTable& built_in_kind_table();

ConditionType parse_condition_type(std::string_view type_name);

Condition extension_condition(const std::vector<std::string>& extensions);

// Normalizes id and subfolder. Throws std::invalid_argument when the id or
// subfolder is empty.
Rule make_rule(std::string_view id, std::string_view description,
               std::string_view subfolder, bool enabled, bool built_in,
               RuleMode mode, std::vector<Condition> conditions);

// Custom rules are prefixed "custom_" and must carry at least one condition.
Rule make_custom_rule(std::string_view id, std::string_view description,
                      std::string_view subfolder, bool enabled, RuleMode mode,
                      std::vector<Condition> conditions);

// Maps every normalized id, description and subfolder to the rule id.
std::map<std::string, std::string> rule_reference_aliases(
    const std::vector<Rule>& rules);

// Subfolder and extension substitutions, then enable/disable, then custom
// rules appended, then a stable reorder by overrides.order.
std::vector<Rule> apply_rule_overrides(const std::vector<Rule>& base,
                                       const RuleOverrides& overrides);
