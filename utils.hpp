#pragma once

#include <algorithm>
#include <filesystem>
#include <format>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;

// A central utility to convert a std::filesystem::path to a UTF-8 encoded
// std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

inline fs::path path_from_utf8(const std::string& s) {
  return fs::path(reinterpret_cast<const char8_t*>(s.c_str()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and common keywords.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string trim_ascii(std::string_view sv) {
  const auto is_space = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
  };
  while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
  return std::string(sv);
}

// "Screen Shot!" -> "screen_shot". Used for rule ids and config references.
inline std::string normalize_identifier(std::string_view value) {
  const std::string lower = string_to_lower_ascii(trim_ascii(value));
  std::string result;
  bool pending_sep = false;
  for (char c : lower) {
    const bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    if (!alnum) {
      pending_sep = true;
      continue;
    }
    if (pending_sep && !result.empty()) result += '_';
    pending_sep = false;
    result += c;
  }
  return result;
}

// "PDF" -> ".pdf". Throws std::invalid_argument on an empty extension.
inline std::string normalize_extension(std::string_view raw_extension) {
  std::string ext = string_to_lower_ascii(trim_ascii(raw_extension));
  if (ext.empty()) {
    throw std::invalid_argument("extension cannot be empty");
  }
  if (ext.front() != '.') ext.insert(ext.begin(), '.');
  return ext;
}

// Longest-suffix match, so ".tar.gz" wins over ".gz" for "a.tar.gz". Returns
// the matching extension or an empty string.
template <typename Range>
std::string longest_matching_extension(std::string_view filename,
                                       const Range& extensions) {
  const std::string lower_name = string_to_lower_ascii(filename);
  std::string best;
  for (const auto& ext : extensions) {
    if (trim_ascii(ext).empty()) continue;
    const std::string normalized = normalize_extension(ext);
    if (lower_name.size() >= normalized.size() &&
        lower_name.compare(lower_name.size() - normalized.size(),
                           normalized.size(), normalized) == 0 &&
        normalized.size() > best.size()) {
      best = normalized;
    }
  }
  return best;
}

template <typename Range>
bool matches_extension(std::string_view filename, const Range& extensions) {
  return !longest_matching_extension(filename, extensions).empty();
}

// Strips surrounding whitespace and slashes. Throws std::invalid_argument for
// an empty result or a ".." component.
inline std::string ensure_unix_subfolder(std::string_view fragment) {
  std::string cleaned = trim_ascii(fragment);
  while (!cleaned.empty() && cleaned.front() == '/') cleaned.erase(0, 1);
  while (!cleaned.empty() && cleaned.back() == '/') cleaned.pop_back();
  if (cleaned.empty()) {
    throw std::invalid_argument("subfolder cannot be empty");
  }
  for (const auto& part : path_from_utf8(cleaned)) {
    if (part == "..") {
      throw std::invalid_argument(
          std::format("subfolder '{}' escapes the destination", cleaned));
    }
  }
  return cleaned;
}

// True when `path` is `root` or lies somewhere below it. Both sides are
// compared lexically after normalization.
inline bool is_within(const fs::path& path, const fs::path& root) {
  const fs::path rel =
      path.lexically_normal().lexically_relative(root.lexically_normal());
  if (rel.empty()) return false;
  const auto first = *rel.begin();
  return first != "..";
}

// Splits "backup.tar.gz" into "backup" and ".tar.gz". Leading dots belong to
// the base, and a name ending in '.' has no suffix.
inline std::pair<std::string, std::string> split_base_and_suffix(
    const std::string& filename) {
  const std::size_t first_char = filename.find_first_not_of('.');
  if (first_char == std::string::npos || filename.ends_with('.')) {
    return {filename, ""};
  }
  const std::size_t dot = filename.find('.', first_char);
  if (dot == std::string::npos) {
    return {filename, ""};
  }
  return {filename.substr(0, dot), filename.substr(dot)};
}

// Generates a unique path by inserting a counter before the whole extension
// suffix (e.g. "file (1).tar.gz") while the target exists on disk or has
// already been handed out in this run. Returns the path and whether it was
// renamed.
inline std::pair<fs::path, bool> generate_unique_path(
    const fs::path& target_path, const std::set<fs::path>& claimed) {
  const auto is_free = [&](const fs::path& p) {
    std::error_code ec;
    return !fs::exists(fs::symlink_status(p, ec)) && !claimed.contains(p);
  };
  if (is_free(target_path)) {
    return {target_path, false};
  }

  const fs::path parent_dir = target_path.parent_path();
  const auto [base, suffix] =
      split_base_and_suffix(safe_path_to_string(target_path.filename()));

  int counter = 1;
  fs::path new_path;
  do {
    const std::string new_filename_str =
        std::format("{} ({}){}", base, counter++, suffix);
    new_path = parent_dir / path_from_utf8(new_filename_str);
  } while (!is_free(new_path));

  return {new_path, true};
}
