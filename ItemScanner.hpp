#pragma once

#include "TagProbe.hpp"
#include "types.hpp"

struct ScanResult {
  std::vector<Item> items;
  int ignored = 0;
};

class ItemScanner {
 public:
  ItemScanner(ScanOptions options, const TagProbe& tag_probe);

  // Items come back sorted by lower-cased relative path. Anything skipped by
  // policy (excluded roots, ignore lists, bundles, tags, aliases) is counted
  // in ScanResult::ignored and never appears in items.
  ScanResult scan(const fs::path& source) const;

 private:
  enum class Verdict { KEEP, SKIP, PRUNE };

  bool is_excluded_path(const fs::path& path, const fs::path& source) const;
  bool is_bundle(const fs::path& path) const;
  Verdict classify_directory(const fs::path& path, const fs::path& source,
                             bool recursive, ScanResult& result) const;
  void consider_file(const fs::directory_entry& entry, const fs::path& source,
                     ScanResult& result) const;
  Item build_item(const fs::directory_entry& entry, const fs::path& source,
                  bool is_directory) const;
  void skip(const fs::path& path, std::string_view reason,
            ScanResult& result) const;

  ScanOptions m_options;
  const TagProbe& m_tag_probe;
};
