#include "UI.hpp"

#include <format>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

#include "utils.hpp"

using namespace ftxui;

namespace {
std::string render_document(Element document) {
  auto screen = Screen::Create(Dimension::Fit(document));
  Render(screen, document);
  return screen.ToString();
}

std::string render_table(std::vector<std::vector<std::string>> rows) {
  Table table(std::move(rows));
  table.SelectAll().Border(LIGHT);
  table.SelectAll().SeparatorVertical(LIGHT);
  table.SelectRow(0).Decorate(bold);
  table.SelectRow(0).Border(LIGHT);
  return render_document(table.Render());
}

std::string counter_panel(
    std::string_view title,
    const std::vector<std::pair<std::string, int>>& rows) {
  Elements lines;
  for (const auto& [label, value] : rows) {
    lines.push_back(hbox({text(label), filler(), text(std::to_string(value))}) |
                    size(WIDTH, GREATER_THAN, 24));
  }
  return render_document(window(text(std::string(title)) | bold, vbox(lines)));
}
}  // namespace

std::string UI::render_rules_table(const std::vector<Rule>& rules) {
  std::vector<std::vector<std::string>> rows;
  rows.push_back({"#", "Rule", "State", "Origin", "Subfolder", "Description"});
  int index = 0;
  for (const auto& rule : rules) {
    rows.push_back({std::to_string(++index), rule.id,
                    rule.enabled ? "on" : "off",
                    rule.built_in ? "[lock]" : "[custom]", rule.subfolder,
                    rule.description});
  }
  return render_table(std::move(rows));
}

std::string UI::render_transactions_table(
    const std::vector<StoredTransaction>& records) {
  std::vector<std::vector<std::string>> rows;
  rows.push_back({"Id", "Created", "State", "Moves", "Source", "Destination"});
  for (const auto& [file, record, load_error] : records) {
    const char* state = load_error        ? "malformed"
                        : record.undone_at ? "done"
                                           : "pending";
    rows.push_back({record.id, record.created_at, state,
                    std::to_string(record.moves.size()),
                    safe_path_to_string(record.source_dir),
                    safe_path_to_string(record.destination_dir)});
  }
  return render_table(std::move(rows));
}

std::string UI::render_plan_table(const std::vector<MovePlanEntry>& plan,
                                  const fs::path& destination_root) {
  std::vector<std::vector<std::string>> rows;
  rows.push_back({"Item", "Destination", "Rule", ""});
  for (const auto& entry : plan) {
    rows.push_back(
        {safe_path_to_string(entry.source.filename()),
         safe_path_to_string(
             entry.destination.lexically_relative(destination_root)
                 .generic_path()),
         entry.rule_id, entry.collision_renamed ? "renamed" : ""});
  }
  return render_table(std::move(rows));
}

std::string UI::render_summary(const Summary& summary, bool apply) {
  return counter_panel(apply ? "Tidy summary" : "Tidy summary (dry-run)",
                       {{"Scanned", summary.scanned},
                        {"Ignored", summary.ignored},
                        {"Matched", summary.matched},
                        {"Unclassified", summary.unclassified},
                        {"Fallback", summary.fallback},
                        {"Planned moves", summary.planned_moves},
                        {"Moved", summary.moved},
                        {"Collisions", summary.collisions},
                        {"Errors", summary.errors},
                        {"Rules used", summary.rules_used}});
}

std::string UI::render_undo_summary(const UndoResult& result, bool apply) {
  return counter_panel(apply ? "Undo summary" : "Undo summary (dry-run)",
                       {{"Restored", result.restored},
                        {"Collisions", result.collisions},
                        {"Errors", result.errors}});
}

