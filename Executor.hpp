#pragma once

#include <expected>

#include "types.hpp"

struct ExecutionResult {
  std::vector<MoveRecord> executed;
  int errors = 0;
};

class Executor {
 public:
  explicit Executor(bool apply);

  // Dry-run only reports. Apply mode moves entry by entry; a failed move is
  // counted and the rest still run.
  ExecutionResult execute(const std::vector<MovePlanEntry>& plan) const;

  // Creates the parent of `to` and renames `from` onto it, falling back to
  // copy-and-remove across filesystems.
  static std::expected<void, OrganizerError> move_entry(const fs::path& from,
                                                        const fs::path& to);

 private:
  bool m_apply;
};

// Removes empty directories below `root` bottom-up, never `root` itself and
// nothing under `excluded_roots`. Returns the removed paths.
std::vector<fs::path> remove_empty_dirs(
    const fs::path& root, const std::vector<fs::path>& excluded_roots);
