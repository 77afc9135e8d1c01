#pragma once

#include <optional>

#include "ItemScanner.hpp"
#include "types.hpp"

struct PlanResult {
  std::vector<MovePlanEntry> plan;
  Summary summary;
};

class RuleEngine {
 public:
  static constexpr const char* kFallbackRuleId = "fallback";

  RuleEngine(std::vector<Rule> rules, const KindTable& kinds,
             TimePoint reference_time = std::chrono::system_clock::now());

  // Items no rule matches go to fallback_subfolder instead of being left
  // unclassified.
  void set_fallback_subfolder(std::optional<std::string> subfolder);

  // First enabled rule, in catalog order, whose conditions hold.
  const Rule* match(const Item& item) const;

  // Matches every scanned item and assigns destinations under `destination`
  // that are pairwise distinct and free on disk. Only existence checks touch
  // the filesystem.
  PlanResult generate_plan(const ScanResult& scan,
                           const fs::path& destination) const;

 private:
  std::vector<Rule> m_rules;
  const KindTable& m_kinds;
  TimePoint m_reference_time;
  std::optional<std::string> m_fallback_subfolder;
};
