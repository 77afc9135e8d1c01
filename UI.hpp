#pragma once

#include <string>
#include <vector>

#include "types.hpp"

// Non-interactive terminal reports. Each function lays its rows out as an
// ftxui table and returns the rendered screen as plain text.
namespace UI {
std::string render_rules_table(const std::vector<Rule>& rules);
std::string render_transactions_table(
    const std::vector<StoredTransaction>& records);
// Destinations are shown relative to `destination_root`.
std::string render_plan_table(const std::vector<MovePlanEntry>& plan,
                              const fs::path& destination_root);
std::string render_summary(const Summary& summary, bool apply);
std::string render_undo_summary(const UndoResult& result, bool apply);
}  // namespace UI
