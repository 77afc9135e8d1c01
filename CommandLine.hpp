#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "Organizer.hpp"

enum class Command { TIDY, RULES_LIST, UNDO_LIST, UNDO, UNDO_DELETE };

struct CommandLine {
  Command command = Command::TIDY;
  bool show_help = false;
  bool verbose = false;
  std::optional<fs::path> log_file;

  // tidy and rules-list share config_path; undo commands use undo_dir, apply,
  // transaction_id and older_than_days.
  TidyOptions tidy;
  std::optional<std::string> transaction_id;
  std::optional<int> older_than_days;
};

std::string usage_text();

// argv without the program name. A missing subcommand means "tidy".
std::expected<CommandLine, OrganizerError> parse_command_line(
    const std::vector<std::string>& args);
