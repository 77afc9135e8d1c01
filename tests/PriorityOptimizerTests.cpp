#include <gtest/gtest.h>

#include "../PriorityOptimizer.hpp"
#include "../RuleCatalog.hpp"
#include "../RuleEngine.hpp"

namespace {
Rule custom_ext_rule(const std::string& id,
                     const std::vector<std::string>& extensions,
                     bool enabled = true) {
  return make_custom_rule(id, id, "Custom/" + id, enabled, RuleMode::ALL,
                          {extension_condition(extensions)});
}

std::vector<std::string> ids(const std::vector<Rule>& rules) {
  std::vector<std::string> out;
  for (const auto& rule : rules) out.push_back(rule.id);
  return out;
}
}  // namespace

TEST(PriorityOptimizerTest, ConditionScoresFollowSpecificity) {
  EXPECT_DOUBLE_EQ(
      condition_specificity_score(extension_condition({".pdf"})), 120.0);
  EXPECT_DOUBLE_EQ(condition_specificity_score(
                       extension_condition({".a", ".b", ".c", ".d"})),
                   30.0);

  Condition name;
  name.type = ConditionType::NAME_CONTAINS;
  name.values = {"a", "b", " ", "c", "d", "e", "f"};
  EXPECT_DOUBLE_EQ(condition_specificity_score(name), 90.0);

  Condition kind;
  kind.type = ConditionType::KIND;
  EXPECT_DOUBLE_EQ(condition_specificity_score(kind), 35.0);

  Condition unknown;
  EXPECT_DOUBLE_EQ(condition_specificity_score(unknown), 0.0);
}

TEST(PriorityOptimizerTest, RuleScoreAddsModeOriginAndConditionCount) {
  // 120 + 12 (all) + 6 (custom) + 3 (one condition)
  EXPECT_DOUBLE_EQ(rule_specificity_score(custom_ext_rule("pdf", {".pdf"})),
                   141.0);
  EXPECT_LT(rule_specificity_score(custom_ext_rule("off", {".pdf"}, false)),
            -1000.0);
}

TEST(PriorityOptimizerTest, SingleExtensionRuleOvertakesBroaderRule) {
  const std::vector<Rule> rules = {
      custom_ext_rule("broad", {".pdf", ".doc", ".txt", ".rtf"}),
      custom_ext_rule("narrow", {".pdf"})};
  Item item;
  item.name = "paper.pdf";

  RuleEngine unoptimized(rules, built_in_kind_table());
  ASSERT_NE(unoptimized.match(item), nullptr);
  EXPECT_EQ(unoptimized.match(item)->id, "custom_broad");

  auto [optimized, report] = optimize_rule_priority(rules);
  RuleEngine engine(optimized, built_in_kind_table());
  ASSERT_NE(engine.match(item), nullptr);
  EXPECT_EQ(engine.match(item)->id, "custom_narrow");

  EXPECT_TRUE(report.enabled);
  EXPECT_TRUE(report.changed);
  EXPECT_EQ(report.strategy, "specificity_v1");
  EXPECT_EQ(report.before_order,
            (std::vector<std::string>{"custom_broad", "custom_narrow"}));
  EXPECT_EQ(report.after_order,
            (std::vector<std::string>{"custom_narrow", "custom_broad"}));
  ASSERT_EQ(report.scores.size(), 2);
  EXPECT_EQ(report.scores[0].rule_id, "custom_narrow");
  EXPECT_EQ(report.scores[0].original_index, 1);
  EXPECT_EQ(report.scores[0].optimized_index, 0);
  EXPECT_DOUBLE_EQ(report.scores[1].score, 51.0);
}

TEST(PriorityOptimizerTest, TiesKeepOrderAndDisabledRulesStayLast) {
  const std::vector<Rule> rules = {
      custom_ext_rule("off_first", {".x"}, false),
      custom_ext_rule("a", {".a"}),
      custom_ext_rule("off_second", {".y"}, false),
      custom_ext_rule("b", {".b"}),
      custom_ext_rule("c", {".c", ".d"})};

  auto [optimized, report] = optimize_rule_priority(rules);

  EXPECT_EQ(ids(optimized),
            (std::vector<std::string>{"custom_a", "custom_b", "custom_c",
                                      "custom_off_first",
                                      "custom_off_second"}));
  // Disabled rules are not scored.
  EXPECT_EQ(report.scores.size(), 3);
}

TEST(PriorityOptimizerTest, BuiltInCatalogKeepsDisabledRulesAtTheEnd) {
  auto [optimized, report] = optimize_rule_priority(built_in_rules());

  ASSERT_EQ(optimized.size(), built_in_rules().size());
  EXPECT_EQ(optimized[optimized.size() - 2].id, "aliases");
  EXPECT_EQ(optimized.back().id, "folders");
  for (std::size_t i = 1; i < report.scores.size(); ++i) {
    EXPECT_GE(report.scores[i - 1].score, report.scores[i].score);
  }
}
