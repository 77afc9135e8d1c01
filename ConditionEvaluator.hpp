#pragma once

#include "types.hpp"

// Pure predicate check. UNKNOWN conditions evaluate to false.
bool evaluate_condition(const Condition& condition, const Item& item,
                        TimePoint reference_time, const KindTable& kinds);

// Disabled rules and rules without conditions never match.
bool matches_rule(const Rule& rule, const Item& item, TimePoint reference_time,
                  const KindTable& kinds);
