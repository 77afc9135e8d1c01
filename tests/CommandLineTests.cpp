#include <gtest/gtest.h>

#include "../CommandLine.hpp"

TEST(CommandLineTest, NoArgumentsMeansDryRunTidy) {
  auto cli = parse_command_line({});

  ASSERT_TRUE(cli.has_value());
  EXPECT_EQ(cli->command, Command::TIDY);
  EXPECT_FALSE(cli->tidy.apply);
  EXPECT_FALSE(cli->tidy.source.has_value());
  EXPECT_FALSE(cli->show_help);
  EXPECT_FALSE(cli->tidy.undo_dir.empty());
}

TEST(CommandLineTest, TidyFlagsAndRepeatedValues) {
  auto cli = parse_command_line(
      {"--downloads-dir", "/tmp/in", "--destination", "/tmp/out", "--apply",
       "--include-subfolders", "--remove-empty-folders", "--ignore-ext", "log",
       "--ignore-ext", ".bak", "--ignore-path", "keep", "--stats-json",
       "/tmp/stats.json", "--optimize-priority", "--verbose"});

  ASSERT_TRUE(cli.has_value()) << cli.error().message;
  EXPECT_EQ(cli->command, Command::TIDY);
  EXPECT_EQ(cli->tidy.source, fs::path("/tmp/in"));
  EXPECT_EQ(cli->tidy.destination, fs::path("/tmp/out"));
  EXPECT_TRUE(cli->tidy.apply);
  EXPECT_TRUE(cli->tidy.include_subfolders);
  EXPECT_TRUE(cli->tidy.remove_empty_folders);
  EXPECT_FALSE(cli->tidy.include_folders);
  EXPECT_EQ(cli->tidy.ignore_extensions,
            (std::vector<std::string>{"log", ".bak"}));
  EXPECT_EQ(cli->tidy.ignore_paths, (std::vector<std::string>{"keep"}));
  EXPECT_EQ(cli->tidy.stats_json, fs::path("/tmp/stats.json"));
  EXPECT_TRUE(cli->tidy.optimize_priority);
  EXPECT_TRUE(cli->verbose);
}

TEST(CommandLineTest, SubcommandMayFollowGlobalOptions) {
  auto cli = parse_command_line(
      {"--log-file", "/tmp/run.log", "undo", "--id", "20240101-000000-ab",
       "--undo-dir", "/tmp/undo"});

  ASSERT_TRUE(cli.has_value()) << cli.error().message;
  EXPECT_EQ(cli->command, Command::UNDO);
  EXPECT_EQ(cli->log_file, fs::path("/tmp/run.log"));
  EXPECT_EQ(cli->transaction_id, "20240101-000000-ab");
  EXPECT_EQ(cli->tidy.undo_dir, fs::path("/tmp/undo"));
  EXPECT_FALSE(cli->tidy.apply);
}

TEST(CommandLineTest, RecognizesEverySubcommand) {
  EXPECT_EQ(parse_command_line({"tidy"})->command, Command::TIDY);
  EXPECT_EQ(parse_command_line({"rules-list"})->command, Command::RULES_LIST);
  EXPECT_EQ(parse_command_line({"undo-list"})->command, Command::UNDO_LIST);
  EXPECT_EQ(parse_command_line({"undo"})->command, Command::UNDO);
  EXPECT_EQ(parse_command_line({"undo-delete"})->command,
            Command::UNDO_DELETE);
}

TEST(CommandLineTest, UndoDeleteParsesAge) {
  auto cli =
      parse_command_line({"undo-delete", "--older-than-days", "30", "--apply"});

  ASSERT_TRUE(cli.has_value());
  EXPECT_EQ(cli->older_than_days, 30);
  EXPECT_TRUE(cli->tidy.apply);

  EXPECT_FALSE(
      parse_command_line({"undo-delete", "--older-than-days", "-1"})
          .has_value());
  EXPECT_FALSE(
      parse_command_line({"undo-delete", "--older-than-days", "3d"})
          .has_value());
}

TEST(CommandLineTest, RejectsUnknownOrMisplacedArguments) {
  EXPECT_FALSE(parse_command_line({"--frobnicate"}).has_value());
  EXPECT_FALSE(parse_command_line({"organize"}).has_value());
  EXPECT_FALSE(parse_command_line({"undo", "extra"}).has_value());
  EXPECT_FALSE(parse_command_line({"--source"}).has_value());
  EXPECT_FALSE(parse_command_line({"undo-list", "--apply"}).has_value());
  EXPECT_FALSE(
      parse_command_line({"rules-list", "--source", "/tmp"}).has_value());
  EXPECT_FALSE(parse_command_line({"tidy", "--id", "x"}).has_value());

  auto error = parse_command_line({"undo", "--include-folders"});
  ASSERT_FALSE(error.has_value());
  EXPECT_EQ(error.error().kind, OrganizerError::Kind::FATAL);
  EXPECT_NE(error.error().message.find("--include-folders"),
            std::string::npos);
}

TEST(CommandLineTest, HelpIsAcceptedEverywhere) {
  EXPECT_TRUE(parse_command_line({"--help"})->show_help);
  EXPECT_TRUE(parse_command_line({"undo", "-h"})->show_help);
  EXPECT_NE(usage_text().find("undo-delete"), std::string::npos);
}
