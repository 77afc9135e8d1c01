#pragma once

#include <expected>
#include <optional>

#include "types.hpp"

// One JSON file per apply run ("<id>.json") inside the undo directory.
// Records are created once, then only their undone_at field is ever written.
class TransactionStore {
 public:
  explicit TransactionStore(fs::path undo_dir);

  std::expected<TransactionRecord, OrganizerError> record(
      const fs::path& source_dir, const fs::path& destination_dir,
      std::vector<MoveRecord> moves, std::vector<fs::path> removed_empty_dirs);

  // Newest first. Every *.json file is listed; one that is not a valid record
  // carries a load_error and no moves.
  std::vector<StoredTransaction> list() const;

  // By id (file name or record id), or the newest record that has not been
  // undone yet. A malformed selection is fatal.
  std::expected<StoredTransaction, OrganizerError> select(
      const std::optional<std::string>& id) const;

  // Replays the record's moves in reverse. Fatal errors (not found, already
  // undone, malformed) abort before anything moves; per-move failures are
  // counted in UndoResult::errors. Only a clean apply marks the record undone,
  // in the file it was read from.
  std::expected<UndoResult, OrganizerError> undo(
      const std::optional<std::string>& id, bool apply);

  // Counts (dry-run) or deletes records matching the id and/or older than the
  // threshold. At least one criterion is required. Malformed records can be
  // deleted by id.
  std::expected<int, OrganizerError> remove(
      const std::optional<std::string>& id,
      std::optional<int> older_than_days, bool apply);

  const fs::path& undo_dir() const { return m_undo_dir; }

 private:
  fs::path path_for(const std::string& id) const;
  std::vector<StoredTransaction> load_all() const;

  fs::path m_undo_dir;
};

std::string make_transaction_id(TimePoint now);
std::string format_iso8601(TimePoint tp);
std::optional<TimePoint> parse_iso8601(const std::string& text);
