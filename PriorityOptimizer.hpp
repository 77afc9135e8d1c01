#pragma once

#include <utility>

#include "types.hpp"

double condition_specificity_score(const Condition& condition);
double rule_specificity_score(const Rule& rule);

// Reorders enabled rules by descending specificity (stable on ties) and keeps
// disabled rules at the end in their original order. Conditions and modes are
// untouched; only priority among competing rules changes.
std::pair<std::vector<Rule>, PriorityOptimizationReport> optimize_rule_priority(
    const std::vector<Rule>& rules);
