#include "ItemScanner.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <optional>

#if defined(__APPLE__) || defined(__unix__)
#include <sys/stat.h>
#endif

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
constexpr std::array<std::string_view, 4> kBundleSuffixes = {
    ".app", ".bundle", ".framework", ".plugin"};

fs::path canonical_or_absolute(const fs::path& p) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(p, ec);
  if (ec) {
    resolved = fs::absolute(p, ec);
  }
  return resolved.lexically_normal();
}

bool is_real_directory(const fs::directory_entry& entry) {
  std::error_code ec;
  return fs::is_directory(entry.symlink_status(ec));
}

// std::filesystem has no lstat-style timestamp; read the link's own mtime.
std::optional<TimePoint> symlink_write_time(const fs::path& path) {
#if defined(__APPLE__) || defined(__unix__)
  struct stat info {};
  if (::lstat(path.c_str(), &info) != 0) return std::nullopt;
#if defined(__APPLE__)
  const timespec& mtime = info.st_mtimespec;
#else
  const timespec& mtime = info.st_mtim;
#endif
  return TimePoint{} +
         std::chrono::duration_cast<TimePoint::duration>(
             std::chrono::seconds{mtime.tv_sec} +
             std::chrono::nanoseconds{mtime.tv_nsec});
#else
  (void)path;
  return std::nullopt;
#endif
}

bool is_empty_directory(const fs::path& path) {
  std::error_code ec;
  const bool empty = fs::is_empty(path, ec);
  return !ec && empty;
}
}  // namespace

ItemScanner::ItemScanner(ScanOptions options, const TagProbe& tag_probe)
    : m_options(std::move(options)), m_tag_probe(tag_probe) {
  for (auto& root : m_options.excluded_roots) {
    root = canonical_or_absolute(root);
  }
}

ScanResult ItemScanner::scan(const fs::path& source) const {
  ScanResult result;
  std::error_code ec;

  if (!m_options.include_subfolders) {
    fs::directory_iterator it(
        source, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      IOManager::log(std::format("Error: cannot list '{}': {}",
                                 safe_path_to_string(source), ec.message()));
      return result;
    }
    for (const auto& entry : it) {
      if (is_real_directory(entry)) {
        classify_directory(entry.path(), source, false, result);
      } else {
        consider_file(entry, source, result);
      }
    }
  } else {
    fs::recursive_directory_iterator it(
        source, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      IOManager::log(std::format("Error: cannot list '{}': {}",
                                 safe_path_to_string(source), ec.message()));
      return result;
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
      const fs::directory_entry entry = *it;
      if (is_real_directory(entry)) {
        // Pruned subtrees are never descended into.
        if (classify_directory(entry.path(), source, true, result) ==
            Verdict::PRUNE) {
          it.disable_recursion_pending();
        }
      } else {
        consider_file(entry, source, result);
      }
      it.increment(ec);
      if (ec) {
        IOManager::log(std::format("Warning: stopped walking '{}': {}",
                                   safe_path_to_string(source), ec.message()));
        break;
      }
    }
  }

  std::sort(result.items.begin(), result.items.end(),
            [](const Item& a, const Item& b) {
              return string_to_lower_ascii(
                         safe_path_to_string(a.relative_path.generic_path())) <
                     string_to_lower_ascii(
                         safe_path_to_string(b.relative_path.generic_path()));
            });
  return result;
}

bool ItemScanner::is_excluded_path(const fs::path& path,
                                   const fs::path& source) const {
  const fs::path relative = path.lexically_relative(source);
  const fs::path resolved = canonical_or_absolute(source) / relative;
  for (const auto& root : m_options.excluded_roots) {
    if (is_within(resolved.lexically_normal(), root)) return true;
  }

  if (m_options.ignore_paths.empty()) return false;
  const std::string rel =
      string_to_lower_ascii(safe_path_to_string(relative.generic_path()));
  const std::string name =
      string_to_lower_ascii(safe_path_to_string(path.filename()));
  const std::string abs = string_to_lower_ascii(
      safe_path_to_string(canonical_or_absolute(path)));
  return m_options.ignore_paths.contains(rel) ||
         m_options.ignore_paths.contains(name) ||
         m_options.ignore_paths.contains(abs);
}

bool ItemScanner::is_bundle(const fs::path& path) const {
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(path.extension()));
  return std::find(kBundleSuffixes.begin(), kBundleSuffixes.end(), ext) !=
         kBundleSuffixes.end();
}

ItemScanner::Verdict ItemScanner::classify_directory(
    const fs::path& path, const fs::path& source, bool recursive,
    ScanResult& result) const {
  if (is_excluded_path(path, source)) {
    skip(path, "excluded path", result);
    return Verdict::PRUNE;
  }
  if (m_options.skip_bundles && is_bundle(path)) {
    skip(path, "bundle", result);
    return Verdict::PRUNE;
  }
  // Recursing descends into folders whether or not they are targets.
  if (!m_options.include_folders) {
    if (!recursive) {
      skip(path, "folder", result);
    }
    return Verdict::SKIP;
  }
  if (m_options.ignore_folders) {
    skip(path, "folder", result);
    return Verdict::SKIP;
  }
  if (m_options.include_empty_folders && !is_empty_directory(path)) {
    skip(path, "non-empty folder", result);
    return Verdict::SKIP;
  }

  Item item = build_item(fs::directory_entry(path), source, true);
  if (m_options.ignore_tagged && item.has_tag) {
    skip(path, "tagged", result);
    return Verdict::SKIP;
  }
  result.items.push_back(std::move(item));
  return Verdict::KEEP;
}

void ItemScanner::consider_file(const fs::directory_entry& entry,
                                const fs::path& source,
                                ScanResult& result) const {
  const fs::path& path = entry.path();
  if (is_excluded_path(path, source)) {
    skip(path, "excluded path", result);
    return;
  }
  Item item = build_item(entry, source, false);
  if (m_options.ignore_aliases && item.is_symlink) {
    skip(path, "alias", result);
    return;
  }
  if (m_options.ignore_tagged && item.has_tag) {
    skip(path, "tagged", result);
    return;
  }
  if (matches_extension(item.name, m_options.ignore_extensions)) {
    skip(path, "ignored extension", result);
    return;
  }
  result.items.push_back(std::move(item));
}

Item ItemScanner::build_item(const fs::directory_entry& entry,
                             const fs::path& source, bool is_directory) const {
  std::error_code ec;
  Item item;
  item.path = entry.path();
  item.relative_path = entry.path().lexically_relative(source);
  item.name = safe_path_to_string(entry.path().filename());
  item.is_directory = is_directory;
  item.is_symlink = fs::is_symlink(entry.symlink_status(ec));

  // Aliases describe the link itself, never its target.
  if (item.is_symlink) {
    if (auto link_time = symlink_write_time(entry.path())) {
      item.modified_at = *link_time;
    }
  } else {
    if (!is_directory && fs::is_regular_file(entry.symlink_status(ec))) {
      const auto size = entry.file_size(ec);
      item.size_bytes = ec ? 0 : size;
    }
    const auto write_time = entry.last_write_time(ec);
    if (!ec) {
      item.modified_at = std::chrono::time_point_cast<TimePoint::duration>(
          std::chrono::file_clock::to_sys(write_time));
    }
  }

  if (m_options.include_tagged || m_options.ignore_tagged) {
    item.has_tag = m_tag_probe.has_tag(entry.path());
  }
  return item;
}

void ItemScanner::skip(const fs::path& path, std::string_view reason,
                       ScanResult& result) const {
  ++result.ignored;
  if (m_options.extra_logging) {
    IOManager::log(
        std::format("SKIP {}: {}", reason, safe_path_to_string(path)));
  }
}
