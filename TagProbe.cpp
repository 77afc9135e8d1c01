#include "TagProbe.hpp"

#if defined(__APPLE__) || defined(__linux__)
#include <sys/types.h>
#include <sys/xattr.h>
#endif

namespace {
#if defined(__APPLE__)
constexpr const char* kTagAttribute = "com.apple.metadata:_kMDItemUserTags";
#elif defined(__linux__)
constexpr const char* kTagAttribute = "user.xdg.tags";
#endif
}  // namespace

bool XattrTagProbe::has_tag(const fs::path& path) const {
#if defined(__APPLE__)
  const ssize_t size = ::getxattr(path.c_str(), kTagAttribute, nullptr, 0, 0,
                                  XATTR_NOFOLLOW);
  return size >= 0;
#elif defined(__linux__)
  const ssize_t size = ::lgetxattr(path.c_str(), kTagAttribute, nullptr, 0);
  return size >= 0;
#else
  (void)path;
  return false;
#endif
}

std::unique_ptr<TagProbe> make_platform_tag_probe() {
#if defined(__APPLE__) || defined(__linux__)
  return std::make_unique<XattrTagProbe>();
#else
  return std::make_unique<NullTagProbe>();
#endif
}
