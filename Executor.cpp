#include "Executor.hpp"

#include <algorithm>
#include <format>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
OrganizerError recoverable(std::string message) {
  return OrganizerError{OrganizerError::Kind::RECOVERABLE, std::move(message)};
}
}  // namespace

Executor::Executor(bool apply) : m_apply(apply) {}

std::expected<void, OrganizerError> Executor::move_entry(const fs::path& from,
                                                         const fs::path& to) {
  std::error_code ec;
  if (!fs::exists(fs::symlink_status(from, ec))) {
    return std::unexpected(recoverable(
        std::format("source '{}' no longer exists", safe_path_to_string(from))));
  }

  const fs::path parent_dir = to.parent_path();
  if (!parent_dir.empty() && !fs::exists(parent_dir, ec)) {
    fs::create_directories(parent_dir, ec);
    if (ec) {
      return std::unexpected(recoverable(
          std::format("failed to create directory '{}': {}",
                      safe_path_to_string(parent_dir), ec.message())));
    }
    IOManager::log(std::format("[DIR] Creating directory: '{}'",
                               safe_path_to_string(parent_dir)));
  }

  fs::rename(from, to, ec);
  if (!ec) {
    return {};
  }
  if (ec != std::errc::cross_device_link) {
    return std::unexpected(recoverable(std::format(
        "cannot move '{}' -> '{}': {}", safe_path_to_string(from),
        safe_path_to_string(to), ec.message())));
  }

  // Different filesystems: copy, then drop the original.
  ec.clear();
  fs::copy(from, to,
           fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove_all(to, cleanup_ec);
    return std::unexpected(recoverable(std::format(
        "cannot copy '{}' -> '{}': {}", safe_path_to_string(from),
        safe_path_to_string(to), ec.message())));
  }
  fs::remove_all(from, ec);
  if (ec) {
    return std::unexpected(recoverable(
        std::format("copied to '{}' but could not remove '{}': {}",
                    safe_path_to_string(to), safe_path_to_string(from),
                    ec.message())));
  }
  return {};
}

ExecutionResult Executor::execute(const std::vector<MovePlanEntry>& plan) const {
  ExecutionResult result;
  if (m_apply) {
    IOManager::log(std::format("Executing {} planned moves...", plan.size()));
  }
  for (const auto& move : plan) {
    if (!m_apply) {
      IOManager::log(std::format("DRY-RUN [{}]: '{}' -> '{}'",
                                 move.rule_description,
                                 safe_path_to_string(move.source),
                                 safe_path_to_string(move.destination)));
      continue;
    }
    if (auto moved = move_entry(move.source, move.destination); !moved) {
      ++result.errors;
      IOManager::log(std::format("ERROR move failed: {}",
                                 moved.error().message));
      continue;
    }
    result.executed.push_back(
        MoveRecord{move.source, move.destination, move.rule_id});
    IOManager::log(std::format("MOVE [{}]: '{}' -> '{}'", move.rule_description,
                               safe_path_to_string(move.source),
                               safe_path_to_string(move.destination)));
  }
  return result;
}

std::vector<fs::path> remove_empty_dirs(
    const fs::path& root, const std::vector<fs::path>& excluded_roots) {
  std::vector<fs::path> directories;
  std::error_code ec;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    IOManager::log(std::format("Warning: cannot walk '{}': {}",
                               safe_path_to_string(root), ec.message()));
    return {};
  }
  const fs::recursive_directory_iterator end;
  while (it != end) {
    const fs::directory_entry entry = *it;
    std::error_code status_ec;
    if (fs::is_directory(entry.symlink_status(status_ec))) {
      const bool excluded =
          std::any_of(excluded_roots.begin(), excluded_roots.end(),
                      [&](const fs::path& ex) {
                        return is_within(entry.path(), ex);
                      });
      if (excluded) {
        it.disable_recursion_pending();
      } else {
        directories.push_back(entry.path());
      }
    }
    it.increment(ec);
    if (ec) {
      IOManager::log(std::format("Warning: stopped walking '{}': {}",
                                 safe_path_to_string(root), ec.message()));
      break;
    }
  }

  // Pre-order walk reversed gives children before parents.
  std::vector<fs::path> removed;
  for (auto dir = directories.rbegin(); dir != directories.rend(); ++dir) {
    std::error_code dir_ec;
    if (!fs::is_empty(*dir, dir_ec) || dir_ec) continue;
    if (fs::remove(*dir, dir_ec) && !dir_ec) {
      removed.push_back(*dir);
      IOManager::log(std::format("REMOVE EMPTY DIR: '{}'",
                                 safe_path_to_string(*dir)));
    }
  }
  return removed;
}
