#include "CommandLine.hpp"

#include <charconv>
#include <format>
#include <map>
#include <set>

#include "IOManager.hpp"

namespace {
OrganizerError usage_error(std::string message) {
  return OrganizerError{OrganizerError::Kind::FATAL, std::move(message)};
}

const std::map<std::string, Command>& command_names() {
  static const std::map<std::string, Command> names = {
      {"tidy", Command::TIDY},
      {"rules-list", Command::RULES_LIST},
      {"undo-list", Command::UNDO_LIST},
      {"undo", Command::UNDO},
      {"undo-delete", Command::UNDO_DELETE}};
  return names;
}

const std::set<std::string>& value_flags() {
  static const std::set<std::string> flags = {
      "--log-file",   "--source",     "--downloads-dir", "--destination",
      "--config",     "--undo-dir",   "--ignore-ext",    "--ignore-path",
      "--stats-json", "--id",         "--older-than-days"};
  return flags;
}

const std::set<std::string>& tidy_switches() {
  static const std::set<std::string> flags = {
      "--include-subfolders",   "--include-folders",
      "--include-empty-folders", "--include-tagged",
      "--ignore-tagged",        "--ignore-aliases",
      "--ignore-folders",       "--skip-bundles",
      "--remove-empty-folders", "--create-dated-top-folder",
      "--optimize-priority",    "--extra-logging"};
  return flags;
}

bool flag_allowed(const std::string& flag, Command command) {
  if (flag == "--log-file" || flag == "--verbose" || flag == "--help" ||
      flag == "-h") {
    return true;
  }
  switch (command) {
    case Command::TIDY:
      return flag != "--id" && flag != "--older-than-days";
    case Command::RULES_LIST:
      return flag == "--config";
    case Command::UNDO_LIST:
      return flag == "--undo-dir";
    case Command::UNDO:
      return flag == "--undo-dir" || flag == "--id" || flag == "--apply";
    case Command::UNDO_DELETE:
      return flag == "--undo-dir" || flag == "--id" ||
             flag == "--older-than-days" || flag == "--apply";
  }
  return false;
}

void set_switch(TidyOptions& tidy, const std::string& flag) {
  if (flag == "--include-subfolders") tidy.include_subfolders = true;
  else if (flag == "--include-folders") tidy.include_folders = true;
  else if (flag == "--include-empty-folders") tidy.include_empty_folders = true;
  else if (flag == "--include-tagged") tidy.include_tagged = true;
  else if (flag == "--ignore-tagged") tidy.ignore_tagged = true;
  else if (flag == "--ignore-aliases") tidy.ignore_aliases = true;
  else if (flag == "--ignore-folders") tidy.ignore_folders = true;
  else if (flag == "--skip-bundles") tidy.skip_bundles = true;
  else if (flag == "--remove-empty-folders") tidy.remove_empty_folders = true;
  else if (flag == "--create-dated-top-folder")
    tidy.create_dated_top_folder = true;
  else if (flag == "--optimize-priority") tidy.optimize_priority = true;
  else if (flag == "--extra-logging") tidy.extra_logging = true;
}
}  // namespace

std::string usage_text() {
  return "Usage:\n"
         "  downloads_tidy [tidy] [--source DIR] [--destination DIR] "
         "[--config FILE]\n"
         "                 [--undo-dir DIR] [--apply] [--include-subfolders] "
         "[--include-folders]\n"
         "                 [--include-empty-folders] [--include-tagged] "
         "[--ignore-tagged]\n"
         "                 [--ignore-aliases] [--ignore-folders] "
         "[--skip-bundles]\n"
         "                 [--remove-empty-folders] "
         "[--create-dated-top-folder]\n"
         "                 [--ignore-ext EXT]... [--ignore-path PATH]... "
         "[--stats-json FILE]\n"
         "                 [--optimize-priority] [--extra-logging]\n"
         "  downloads_tidy rules-list [--config FILE]\n"
         "  downloads_tidy undo-list [--undo-dir DIR]\n"
         "  downloads_tidy undo [--undo-dir DIR] [--id ID] [--apply]\n"
         "  downloads_tidy undo-delete [--undo-dir DIR] [--id ID] "
         "[--older-than-days N] [--apply]\n"
         "\n"
         "Global options: --log-file FILE, --verbose, --help\n"
         "Every command is a dry-run unless --apply is given.\n";
}

std::expected<CommandLine, OrganizerError> parse_command_line(
    const std::vector<std::string>& args) {
  CommandLine cli;
  cli.tidy.undo_dir = IOManager::get_default_undo_dir();

  // First pass: find the subcommand, skipping flag values.
  std::optional<std::size_t> command_index;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if (token.starts_with("-")) {
      if (value_flags().contains(token)) ++i;
      continue;
    }
    if (command_index) {
      return std::unexpected(
          usage_error(std::format("unexpected argument '{}'", token)));
    }
    auto it = command_names().find(token);
    if (it == command_names().end()) {
      return std::unexpected(
          usage_error(std::format("unknown command '{}'", token)));
    }
    cli.command = it->second;
    command_index = i;
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    if (command_index && i == *command_index) continue;
    const std::string& flag = args[i];
    const bool known = value_flags().contains(flag) ||
                       tidy_switches().contains(flag) || flag == "--apply" ||
                       flag == "--verbose" || flag == "--help" || flag == "-h";
    if (!known) {
      return std::unexpected(
          usage_error(std::format("unknown option '{}'", flag)));
    }
    if (!flag_allowed(flag, cli.command)) {
      return std::unexpected(usage_error(
          std::format("option '{}' does not apply to this command", flag)));
    }

    if (!value_flags().contains(flag)) {
      if (flag == "--help" || flag == "-h") cli.show_help = true;
      else if (flag == "--verbose") cli.verbose = true;
      else if (flag == "--apply") cli.tidy.apply = true;
      else set_switch(cli.tidy, flag);
      continue;
    }

    if (i + 1 >= args.size()) {
      return std::unexpected(
          usage_error(std::format("option '{}' needs a value", flag)));
    }
    const std::string& value = args[++i];
    if (flag == "--log-file") {
      cli.log_file = IOManager::expand_user(value);
    } else if (flag == "--source" || flag == "--downloads-dir") {
      cli.tidy.source = IOManager::expand_user(value);
    } else if (flag == "--destination") {
      cli.tidy.destination = IOManager::expand_user(value);
    } else if (flag == "--config") {
      cli.tidy.config_path = IOManager::expand_user(value);
    } else if (flag == "--undo-dir") {
      cli.tidy.undo_dir = IOManager::expand_user(value);
    } else if (flag == "--ignore-ext") {
      cli.tidy.ignore_extensions.push_back(value);
    } else if (flag == "--ignore-path") {
      cli.tidy.ignore_paths.push_back(value);
    } else if (flag == "--stats-json") {
      cli.tidy.stats_json = IOManager::expand_user(value);
    } else if (flag == "--id") {
      cli.transaction_id = value;
    } else if (flag == "--older-than-days") {
      int days = 0;
      const auto [end, ec] =
          std::from_chars(value.data(), value.data() + value.size(), days);
      if (ec != std::errc{} || end != value.data() + value.size() ||
          days < 0) {
        return std::unexpected(usage_error(std::format(
            "--older-than-days expects a non-negative integer, got '{}'",
            value)));
      }
      cli.older_than_days = days;
    }
  }
  return cli;
}
