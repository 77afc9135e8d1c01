#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "../ItemScanner.hpp"
#include "../TagProbe.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;

namespace {
// Reports a tag on every entry whose name appears in `tagged`.
class FakeTagProbe : public TagProbe {
 public:
  explicit FakeTagProbe(std::set<std::string> tagged)
      : m_tagged(std::move(tagged)) {}

  bool has_tag(const fs::path& path) const override {
    ++calls;
    return m_tagged.contains(path.filename().string());
  }

  mutable int calls = 0;

 private:
  std::set<std::string> m_tagged;
};

std::vector<std::string> names(const ScanResult& result) {
  std::vector<std::string> out;
  for (const auto& item : result.items) {
    out.push_back(item.relative_path.generic_string());
  }
  return out;
}
}  // namespace

class ItemScannerTest : public ScratchDirTest {
 protected:
  ScanResult Scan(ScanOptions options, const TagProbe& tags) {
    ItemScanner scanner(std::move(options), tags);
    return scanner.scan(test_dir);
  }

  ScanResult Scan(ScanOptions options = {}) {
    return Scan(std::move(options), no_tags);
  }

  NullTagProbe no_tags;
};

TEST_F(ItemScannerTest, TopLevelScanSkipsFoldersAndSortsByName) {
  CreateDummyFile("b.txt");
  CreateDummyFile("A.pdf");
  CreateDummyFile("nested/c.txt");

  ScanResult result = Scan();

  EXPECT_EQ(names(result), (std::vector<std::string>{"A.pdf", "b.txt"}));
  EXPECT_EQ(result.ignored, 1);  // the "nested" folder
}

TEST_F(ItemScannerTest, RecursiveScanDescendsIntoSubfolders) {
  CreateDummyFile("top.txt");
  CreateDummyFile("nested/deeper/c.txt");

  ScanOptions options;
  options.include_subfolders = true;
  ScanResult result = Scan(options);

  EXPECT_EQ(names(result),
            (std::vector<std::string>{"nested/deeper/c.txt", "top.txt"}));
  EXPECT_EQ(result.ignored, 0);
}

TEST_F(ItemScannerTest, IgnoredExtensionsAreCountedNotScanned) {
  CreateDummyFile("movie.mp4.part");
  CreateDummyFile("setup.crdownload");
  CreateDummyFile("keep.mp4");

  ScanOptions options;
  options.ignore_extensions = {".part", ".crdownload"};
  ScanResult result = Scan(options);

  EXPECT_EQ(names(result), (std::vector<std::string>{"keep.mp4"}));
  EXPECT_EQ(result.ignored, 2);
}

TEST_F(ItemScannerTest, ExcludedRootIsPrunedBeforeDescent) {
  CreateDummyFile("Sorted/Documents/PDF/old.pdf");
  CreateDummyFile("Sorted/Audio/song.mp3");
  CreateDummyFile("new.pdf");

  ScanOptions options;
  options.include_subfolders = true;
  options.excluded_roots = {test_dir / "Sorted"};
  ScanResult result = Scan(options);

  EXPECT_EQ(names(result), (std::vector<std::string>{"new.pdf"}));
  // Only the pruned root itself is counted; its contents are never visited.
  EXPECT_EQ(result.ignored, 1);
}

TEST_F(ItemScannerTest, IgnorePathsMatchNameOrRelativePathCaseInsensitively) {
  CreateDummyFile("Keep Me.txt");
  CreateDummyFile("private/secret.txt");
  CreateDummyFile("other/file.txt");

  ScanOptions options;
  options.include_subfolders = true;
  options.ignore_paths = {"keep me.txt", "private"};
  ScanResult result = Scan(options);

  EXPECT_EQ(names(result), (std::vector<std::string>{"other/file.txt"}));
  EXPECT_EQ(result.ignored, 2);
}

TEST_F(ItemScannerTest, BundlesAreSkippedWholeByDefault) {
  CreateDummyFile("Tool.app/Contents/Info.plist");
  CreateDummyFile("loose.plist");

  ScanOptions options;
  options.include_subfolders = true;
  options.include_folders = true;
  ScanResult result = Scan(options);

  EXPECT_EQ(names(result), (std::vector<std::string>{"loose.plist"}));
  EXPECT_EQ(result.ignored, 1);

  options.skip_bundles = false;
  result = Scan(options);
  EXPECT_EQ(names(result),
            (std::vector<std::string>{"loose.plist", "Tool.app",
                                      "Tool.app/Contents",
                                      "Tool.app/Contents/Info.plist"}));
}

TEST_F(ItemScannerTest, FolderItemsReportDirectoryAndZeroSize) {
  CreateDummyFile("project/main.cpp");

  ScanOptions options;
  options.include_folders = true;
  ScanResult result = Scan(options);

  ASSERT_EQ(result.items.size(), 1);
  EXPECT_TRUE(result.items[0].is_directory);
  EXPECT_FALSE(result.items[0].is_symlink);
  EXPECT_EQ(result.items[0].size_bytes, 0);
  EXPECT_EQ(result.items[0].name, "project");
}

TEST_F(ItemScannerTest, EmptyFolderModeKeepsOnlyEmptyFolders) {
  CreateDummyDirectory("empty");
  CreateDummyFile("full/file.txt");

  ScanOptions options;
  options.include_folders = true;
  options.include_empty_folders = true;
  ScanResult result = Scan(options);

  EXPECT_EQ(names(result), (std::vector<std::string>{"empty"}));
  EXPECT_EQ(result.ignored, 1);
}

TEST_F(ItemScannerTest, IgnoreFoldersWinsOverIncludeFolders) {
  CreateDummyDirectory("folder");
  CreateDummyFile("file.txt");

  ScanOptions options;
  options.include_folders = true;
  options.ignore_folders = true;
  ScanResult result = Scan(options);

  EXPECT_EQ(names(result), (std::vector<std::string>{"file.txt"}));
  EXPECT_EQ(result.ignored, 1);
}

TEST_F(ItemScannerTest, SymlinksAreAliasItemsNeverDirectories) {
  const fs::path target = CreateDummyDirectory("real");
  std::error_code ec;
  fs::create_directory_symlink(target, test_dir / "link", ec);
  if (ec) {
    GTEST_SKIP() << "symlinks not available: " << ec.message();
  }

  ScanResult result = Scan();
  ASSERT_EQ(result.items.size(), 1);
  EXPECT_EQ(result.items[0].name, "link");
  EXPECT_TRUE(result.items[0].is_symlink);
  EXPECT_FALSE(result.items[0].is_directory);

  ScanOptions options;
  options.ignore_aliases = true;
  result = Scan(options);
  EXPECT_TRUE(result.items.empty());
  EXPECT_EQ(result.ignored, 2);  // the alias and the "real" folder
}

TEST_F(ItemScannerTest, AliasItemsDescribeTheLinkNotItsTarget) {
  const fs::path target = CreateDummyFile("real.bin", std::string(1234, 'x'));
  const auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(48);
  fs::last_write_time(target, old_time);
  std::error_code ec;
  fs::create_symlink(target, test_dir / "alias.bin", ec);
  if (ec) {
    GTEST_SKIP() << "symlinks not available: " << ec.message();
  }
  fs::create_symlink(test_dir / "gone.bin", test_dir / "dangling.bin", ec);
  ASSERT_FALSE(ec) << ec.message();

  ScanResult result = Scan();

  ASSERT_EQ(result.items.size(), 3);
  const auto now = std::chrono::system_clock::now();
  for (const auto& item : result.items) {
    if (item.name == "real.bin") {
      EXPECT_EQ(item.size_bytes, 1234);
      EXPECT_GT(now - item.modified_at, std::chrono::hours(47));
      continue;
    }
    EXPECT_TRUE(item.is_symlink) << item.name;
    EXPECT_EQ(item.size_bytes, 0) << item.name;
    EXPECT_LT(now - item.modified_at, std::chrono::hours(1)) << item.name;
  }
}

TEST_F(ItemScannerTest, TagsAreProbedOnlyWhenRequested) {
  CreateDummyFile("tagged.pdf");
  CreateDummyFile("plain.pdf");
  FakeTagProbe probe({"tagged.pdf"});

  ScanResult result = Scan({}, probe);
  EXPECT_EQ(result.items.size(), 2);
  EXPECT_EQ(probe.calls, 0);

  ScanOptions options;
  options.ignore_tagged = true;
  result = Scan(options, probe);
  EXPECT_EQ(names(result), (std::vector<std::string>{"plain.pdf"}));
  EXPECT_EQ(result.ignored, 1);
  EXPECT_GT(probe.calls, 0);

  ScanOptions include;
  include.include_tagged = true;
  result = Scan(include, probe);
  ASSERT_EQ(result.items.size(), 2);
  const auto tagged = std::find_if(
      result.items.begin(), result.items.end(),
      [](const Item& item) { return item.name == "tagged.pdf"; });
  ASSERT_NE(tagged, result.items.end());
  EXPECT_TRUE(tagged->has_tag);
}

TEST_F(ItemScannerTest, FileItemsCarrySizeAndModificationTime) {
  CreateDummyFile("sized.bin", std::string(1234, 'x'));

  ScanResult result = Scan();

  ASSERT_EQ(result.items.size(), 1);
  EXPECT_EQ(result.items[0].size_bytes, 1234);
  const auto age = std::chrono::system_clock::now() - result.items[0].modified_at;
  EXPECT_LT(age, std::chrono::hours(1));
}
