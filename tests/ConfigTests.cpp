#include <gtest/gtest.h>

#include "../IOManager.hpp"
#include "../RuleCatalog.hpp"
#include "TestSupport.hpp"

TEST(ConfigTest, ParsesEverySection) {
  const json raw = json::parse(R"({
    "ignore": {
      "extensions": ["LOG", ".bak"],
      "paths": ["  Keep Me  "],
      "aliases": true
    },
    "options": {
      "include_subfolders": true,
      "skip_bundles": false,
      "fallback_subfolder": "/Other/"
    },
    "rules": {
      "enable": ["Folders"],
      "disable": ["PDF Documents"],
      "order": ["Torrents", "markdown"]
    },
    "extension_rules": {"plain_text": ["txt", "nfo"]},
    "subfolders": {"Images/PNG": "Pictures/PNG"},
    "custom_rules": {
      "invoices": {
        "description": "Invoices",
        "subfolder": "Finance/Invoices",
        "mode": "any",
        "conditions": [
          {"type": "name_contains", "value": ["invoice", "receipt"]},
          {"type": "extension_any", "value": "PDF"}
        ]
      }
    }
  })");

  const auto config = IOManager::parse_config(raw, built_in_rules());
  ASSERT_TRUE(config.has_value());

  EXPECT_EQ(config->ignore_extensions,
            (std::set<std::string>{".log", ".bak"}));
  EXPECT_EQ(config->ignore_paths, (std::set<std::string>{"keep me"}));
  EXPECT_EQ(config->ignore_aliases, true);
  EXPECT_FALSE(config->ignore_folders.has_value());
  EXPECT_EQ(config->include_subfolders, true);
  EXPECT_EQ(config->skip_bundles, false);
  EXPECT_EQ(config->fallback_subfolder, "Other");

  EXPECT_TRUE(config->rules.enable.contains("folders"));
  EXPECT_TRUE(config->rules.disable.contains("pdf_documents"));
  EXPECT_EQ(config->rules.order,
            (std::vector<std::string>{"torrents", "markdown"}));
  EXPECT_EQ(config->rules.extensions.at("plain_text"),
            (std::vector<std::string>{".txt", ".nfo"}));
  EXPECT_EQ(config->rules.subfolders.at("png_images"), "Pictures/PNG");

  ASSERT_EQ(config->rules.custom_rules.size(), 1);
  const Rule& custom = config->rules.custom_rules[0];
  EXPECT_EQ(custom.id, "custom_invoices");
  EXPECT_EQ(custom.subfolder, "Finance/Invoices");
  EXPECT_EQ(custom.mode, RuleMode::ANY);
  ASSERT_EQ(custom.conditions.size(), 2);
  EXPECT_EQ(custom.conditions[1].type, ConditionType::EXTENSION_ANY);
  EXPECT_EQ(custom.conditions[1].values, (std::vector<std::string>{".pdf"}));
}

TEST(ConfigTest, CustomRuleShortcutsAndArrayForm) {
  const json raw = json::parse(R"({
    "custom_rules": [
      {"id": "Big Videos", "kind": "video", "size_gte": 1000000},
      {"extensions": [".sketch"], "folder_name": "Design"}
    ]
  })");

  const auto config = IOManager::parse_config(raw, built_in_rules());
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->rules.custom_rules.size(), 2);

  const Rule& big = config->rules.custom_rules[0];
  EXPECT_EQ(big.id, "custom_big_videos");
  EXPECT_EQ(big.subfolder, "Custom/Big Videos");
  ASSERT_EQ(big.conditions.size(), 2);
  EXPECT_EQ(big.conditions[0].type, ConditionType::KIND);
  EXPECT_EQ(big.conditions[1].type, ConditionType::SIZE_GTE);
  EXPECT_DOUBLE_EQ(big.conditions[1].threshold, 1000000.0);

  const Rule& design = config->rules.custom_rules[1];
  EXPECT_EQ(design.id, "custom_rule_2");
  EXPECT_EQ(design.subfolder, "Design");
}

TEST(ConfigTest, UnknownConditionTypeIsKeptButInert) {
  const json raw = json::parse(R"({
    "custom_rules": {"odd": {"conditions": [{"type": "mime", "value": "x"}]}}
  })");

  const auto config = IOManager::parse_config(raw, built_in_rules());
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->rules.custom_rules[0].conditions.size(), 1);
  EXPECT_EQ(config->rules.custom_rules[0].conditions[0].type,
            ConditionType::UNKNOWN);
}

TEST(ConfigTest, RejectsInvalidInput) {
  const auto& base = built_in_rules();
  EXPECT_FALSE(IOManager::parse_config(json::array(), base).has_value());
  EXPECT_FALSE(IOManager::parse_config(
                   json::parse(R"({"custom_rules": {"x": {"mode": "some",
                                   "extensions": [".a"]}}})"),
                   base)
                   .has_value());
  EXPECT_FALSE(IOManager::parse_config(
                   json::parse(R"({"custom_rules": {"x": {}}})"), base)
                   .has_value());
  EXPECT_FALSE(IOManager::parse_config(
                   json::parse(R"({"subfolders": {"audio": "../escape"}})"),
                   base)
                   .has_value());
  EXPECT_FALSE(IOManager::parse_config(
                   json::parse(R"({"ignore": {"extensions": [""]}})"), base)
                   .has_value());
}

TEST(ConfigTest, RejectsNonFiniteThresholds) {
  const auto& base = built_in_rules();
  for (const char* text : {
           R"({"custom_rules": {"x": {"size_gte": "inf"}}})",
           R"({"custom_rules": {"x": {"size_lte": "-inf"}}})",
           R"({"custom_rules": {"x": {"created_within_days": "nan"}}})",
           R"({"custom_rules": {"x": {"conditions": [
                 {"type": "size_gte", "value": "Infinity"}]}}})"}) {
    EXPECT_FALSE(IOManager::parse_config(json::parse(text), base).has_value())
        << text;
  }

  const auto huge = IOManager::parse_config(
      json::parse(R"({"custom_rules": {"x": {"created_within_days": 1e300}}})"),
      base);
  ASSERT_TRUE(huge.has_value());
  EXPECT_DOUBLE_EQ(huge->rules.custom_rules[0].conditions[0].threshold, 1e300);
}

class ConfigFileTest : public ScratchDirTest {};

TEST_F(ConfigFileTest, LoadsFromDiskAndReportsMissingOrBrokenFiles) {
  CreateDummyFile("good.json", R"({"rules": {"disable": ["audio"]}})");
  CreateDummyFile("broken.json", "{ not json");

  const auto good =
      IOManager::load_config(test_dir / "good.json", built_in_rules());
  ASSERT_TRUE(good.has_value());
  EXPECT_TRUE(good->rules.disable.contains("audio"));

  EXPECT_FALSE(IOManager::load_config(test_dir / "broken.json",
                                      built_in_rules())
                   .has_value());
  EXPECT_FALSE(IOManager::load_config(test_dir / "missing.json",
                                      built_in_rules())
                   .has_value());
}
