#pragma once

#include <memory>

#include "types.hpp"

// Answers "does this entry carry a user tag?" from OS extended attributes.
class TagProbe {
 public:
  virtual ~TagProbe() = default;
  virtual bool has_tag(const fs::path& path) const = 0;
};

// For platforms without extended attributes.
class NullTagProbe : public TagProbe {
 public:
  bool has_tag(const fs::path&) const override { return false; }
};

// Finder tags on macOS (com.apple.metadata:_kMDItemUserTags), desktop tags
// on Linux (user.xdg.tags).
class XattrTagProbe : public TagProbe {
 public:
  bool has_tag(const fs::path& path) const override;
};

std::unique_ptr<TagProbe> make_platform_tag_probe();
