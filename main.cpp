#include <algorithm>
#include <exception>
#include <format>
#include <print>
#include <string>
#include <vector>

#include "CommandLine.hpp"
#include "IOManager.hpp"
#include "Organizer.hpp"
#include "TransactionStore.hpp"
#include "UI.hpp"
#include "utils.hpp"

namespace {
constexpr int kExitOk = 0;
constexpr int kExitErrors = 1;
constexpr int kExitFatal = 2;

int report_fatal(const OrganizerError& error) {
  IOManager::log(std::format("ERROR: {}", error.message));
  return kExitFatal;
}

int run_tidy_command(const CommandLine& cli) {
  auto report = run_tidy(cli.tidy);
  if (!report) {
    return report_fatal(report.error());
  }
  if (!report->plan.empty()) {
    std::print("{}", UI::render_plan_table(report->plan,
                                           report->destination_dir));
  }
  std::print("{}", UI::render_summary(report->summary, report->apply));
  if (!report->apply && !report->plan.empty()) {
    std::println("Dry-run only. Re-run with --apply to move {} item(s).",
                 report->plan.size());
  }
  if (report->transaction) {
    std::println("Undo with: downloads_tidy undo --id {}",
                 report->transaction->id);
  }
  return report->summary.errors > 0 ? kExitErrors : kExitOk;
}

int run_rules_list_command(const CommandLine& cli) {
  auto rule_set = resolve_rules(cli.tidy.config_path);
  if (!rule_set) {
    return report_fatal(rule_set.error());
  }
  const auto built_in = std::count_if(
      rule_set->rules.begin(), rule_set->rules.end(),
      [](const Rule& rule) { return rule.built_in; });
  IOManager::log(std::format("RULE COUNT: {} (built-in={} custom={})",
                             rule_set->rules.size(), built_in,
                             rule_set->rules.size() - built_in));
  std::print("{}", UI::render_rules_table(rule_set->rules));
  return kExitOk;
}

int run_undo_list_command(const CommandLine& cli) {
  const TransactionStore store(cli.tidy.undo_dir);
  const auto records = store.list();
  if (records.empty()) {
    IOManager::log(std::format("No undo records found in '{}'",
                               safe_path_to_string(store.undo_dir())));
    return kExitOk;
  }
  IOManager::log(std::format("UNDO RECORDS: {}", records.size()));
  std::print("{}", UI::render_transactions_table(records));
  return kExitOk;
}

int run_undo_command(const CommandLine& cli) {
  TransactionStore store(cli.tidy.undo_dir);
  auto result = store.undo(cli.transaction_id, cli.tidy.apply);
  if (!result) {
    return report_fatal(result.error());
  }
  IOManager::log(std::format("UNDO SUMMARY restored={} collisions={} errors={}",
                             result->restored, result->collisions,
                             result->errors));
  std::print("{}", UI::render_undo_summary(*result, cli.tidy.apply));
  return result->errors > 0 ? kExitErrors : kExitOk;
}

int run_undo_delete_command(const CommandLine& cli) {
  TransactionStore store(cli.tidy.undo_dir);
  auto count =
      store.remove(cli.transaction_id, cli.older_than_days, cli.tidy.apply);
  if (!count) {
    return report_fatal(count.error());
  }
  IOManager::log(cli.tidy.apply
                     ? std::format("Deleted undo records: {}", *count)
                     : std::format("DRY-RUN delete count={}", *count));
  return kExitOk;
}
}  // namespace

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  auto cli = parse_command_line(args);
  if (!cli) {
    std::println(stderr, "error: {}\n", cli.error().message);
    std::print(stderr, "{}", usage_text());
    return kExitFatal;
  }
  if (cli->show_help) {
    std::print("{}", usage_text());
    return kExitOk;
  }

  IOManager::set_log_handler(
      [](std::string_view message) { std::println("{}", message); });
  IOManager::set_verbose(cli->verbose);
  if (cli->log_file) {
    IOManager::initialize_logger(*cli->log_file);
  }

  try {
    switch (cli->command) {
      case Command::TIDY:
        return run_tidy_command(*cli);
      case Command::RULES_LIST:
        return run_rules_list_command(*cli);
      case Command::UNDO_LIST:
        return run_undo_list_command(*cli);
      case Command::UNDO:
        return run_undo_command(*cli);
      case Command::UNDO_DELETE:
        return run_undo_delete_command(*cli);
    }
  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "Fatal error: {}", e.what());
  }
  return kExitFatal;
}
