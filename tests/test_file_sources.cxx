#include "test-utils.hxx"

#include <sarfile/archive.hxx>
#include <sarfile/errors.hxx>
#include <sarfile/file-sources.hxx>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using sarfile::ExtensionFilter;
using sarfile::test::TempDir;
using sarfile::test::write_file;

namespace {

std::vector<std::string> names_of(const sarfile::PackSource &source) {
  std::vector<std::string> out;
  for (const auto &member : source.members)
    out.push_back(member.name);
  return out;
}

/**
 * @brief A small tree with files of several extensions.
 */
void make_tree(const TempDir &dir) {
  write_file(dir / "tree" / "b.txt", "bee");
  write_file(dir / "tree" / "a.json", "{}");
  write_file(dir / "tree" / "sub" / "c.txt", "sea");
  write_file(dir / "tree" / "sub" / "deeper" / "d.bin", "dee");
  write_file(dir / "tree" / "noext", "none");
}

} // namespace

TEST(FileSourcesTest, PacksTenFilesFromADirectory) {
  TempDir dir;
  for (int i = 0; i < 10; ++i)
    write_file(dir / "input" / fmt::format("file{}.txt", i),
               fmt::format("Hello from {}!", i));

  const auto input = sarfile::from_directory(dir / "input");
  ASSERT_EQ(input.members.size(), 10u);
  const auto archive_path = dir / "out.sar";
  sarfile::pack_to_path(archive_path.string(), input);

  const auto archive = sarfile::Archive::open(archive_path.string());
  ASSERT_EQ(archive.size(), 10u);
  for (int i = 0; i < 10; ++i) {
    const auto name = fmt::format("file{}.txt", i);
    EXPECT_EQ(archive.read(name), fmt::format("Hello from {}!", i)) << name;
  }
}

TEST(FileSourcesTest, DirectoryMembersAreSortedRelativePaths) {
  TempDir dir;
  make_tree(dir);

  const auto input = sarfile::from_directory(dir / "tree");
  EXPECT_EQ(names_of(input),
            (std::vector<std::string>{"a.json", "b.txt", "noext",
                                      "sub/c.txt", "sub/deeper/d.bin"}));
  EXPECT_EQ(input.members[3].size, 3u);

  auto stream = input.source("sub/deeper/d.bin");
  ASSERT_TRUE(stream);
  std::string content;
  *stream >> content;
  EXPECT_EQ(content, "dee");
}

TEST(FileSourcesTest, FiltersByAllowedExtensions) {
  TempDir dir;
  make_tree(dir);

  ExtensionFilter filter;
  filter.only = std::set<std::string>{"txt", ".bin"};
  EXPECT_EQ(names_of(sarfile::from_directory(dir / "tree", filter)),
            (std::vector<std::string>{"b.txt", "sub/c.txt",
                                      "sub/deeper/d.bin"}));
}

TEST(FileSourcesTest, FiltersByExcludedExtensions) {
  TempDir dir;
  make_tree(dir);

  ExtensionFilter filter;
  filter.exclude = std::set<std::string>{".txt"};
  EXPECT_EQ(names_of(sarfile::from_directory(dir / "tree", filter)),
            (std::vector<std::string>{"a.json", "noext", "sub/deeper/d.bin"}));
}

TEST(FileSourcesTest, AppliesBothFilterLists) {
  TempDir dir;
  make_tree(dir);

  ExtensionFilter filter;
  filter.only = std::set<std::string>{".txt", ".json"};
  filter.exclude = std::set<std::string>{"json"};
  EXPECT_EQ(names_of(sarfile::from_directory(dir / "tree", filter)),
            (std::vector<std::string>{"b.txt", "sub/c.txt"}));
}

TEST(FileSourcesTest, EmptyExtensionSelectsFilesWithoutOne) {
  ExtensionFilter filter;
  filter.only = std::set<std::string>{""};
  EXPECT_TRUE(filter.accepts("dir/noext"));
  EXPECT_FALSE(filter.accepts("dir/file.txt"));
}

TEST(FileSourcesTest, NonDirectoryIsAStorageError) {
  TempDir dir;
  write_file(dir / "file.txt", "x");
  EXPECT_THROW(sarfile::from_directory(dir / "file.txt"),
               sarfile::StorageError);
  EXPECT_THROW(sarfile::from_directory(dir / "missing"), sarfile::StorageError);
}

TEST(FileSourcesTest, EmptyDirectoryCannotBePacked) {
  TempDir dir;
  fs::create_directories(dir / "empty");
  const auto input = sarfile::from_directory(dir / "empty");
  EXPECT_TRUE(input.members.empty());
  EXPECT_THROW(sarfile::pack_to_path((dir / "out.sar").string(), input),
               sarfile::EmptyArchive);
}

TEST(FileSourcesTest, FileListIsNamedFromItsCommonParent) {
  TempDir dir;
  make_tree(dir);

  const auto input = sarfile::from_files({dir / "tree" / "sub" / "deeper" / "d.bin",
                                          dir / "tree" / "sub" / "c.txt",
                                          dir / "tree" / "missing.txt"});
  EXPECT_EQ(names_of(input),
            (std::vector<std::string>{"deeper/d.bin", "c.txt"}));

  const auto archive_path = dir / "list.sar";
  sarfile::pack_to_path(archive_path.string(), input);
  const auto archive = sarfile::Archive::open(archive_path.string());
  EXPECT_EQ(archive.read("deeper/d.bin"), "dee");
  EXPECT_EQ(archive.read("c.txt"), "sea");
}

TEST(FileSourcesTest, FileListHonoursTheFilter) {
  TempDir dir;
  make_tree(dir);

  ExtensionFilter filter;
  filter.exclude = std::set<std::string>{"bin"};
  const auto input = sarfile::from_files(
      {dir / "tree" / "b.txt", dir / "tree" / "sub" / "deeper" / "d.bin"},
      filter);
  EXPECT_EQ(names_of(input), (std::vector<std::string>{"b.txt"}));
}
