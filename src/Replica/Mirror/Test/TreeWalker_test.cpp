//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <Replica/Mirror/TreeWalker.h>
#include <Replica/Testing/GTest.h>
#include <Replica/Testing/TempDirectory.h>

using replica::mirror::ListFiles;
using replica::mirror::TreeEntry;
using replica::mirror::WalkTree;
using replica::testing::TempDirectory;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace {

//! Test: every directory is visited before anything below it.
NOLINT_TEST(TreeWalkerTest, DirectoriesComeBeforeTheirContents)
{
  // Arrange
  const TempDirectory root;
  root.AddFile("a/b/c.txt");
  root.AddFile("a/d.txt");
  root.AddFile("e.txt");
  root.AddDirectory("empty");

  // Act
  std::vector<TreeEntry> entries;
  WalkTree(root.Path(), [&](const TreeEntry& e) { entries.push_back(e); });

  // Assert
  std::vector<std::string> seen_directories;
  for (const auto& entry : entries) {
    if (entry.is_directory) {
      seen_directories.push_back(entry.relative_path);
      continue;
    }
    const auto parent
      = std::filesystem::path(entry.relative_path).parent_path().generic_string();
    if (!parent.empty()) {
      EXPECT_NE(std::find(seen_directories.begin(), seen_directories.end(), parent),
        seen_directories.end())
        << entry.relative_path << " visited before " << parent;
    }
  }
  EXPECT_THAT(seen_directories, UnorderedElementsAre("a", "a/b", "empty"));
  EXPECT_EQ(entries.size(), 6U);
}

//! Test: ListFiles returns only files, relative and sorted.
NOLINT_TEST(TreeWalkerTest, ListFilesIsSortedAndRelative)
{
  const TempDirectory root;
  root.AddFile("d.txt");
  root.AddFile("a/c.txt");
  root.AddFile("a/b.txt");
  root.AddDirectory("z");

  EXPECT_THAT(ListFiles(root.Path()), ElementsAre("a/b.txt", "a/c.txt", "d.txt"));
}

//! Test: a symbolic link to a directory is a file entry and is not entered.
NOLINT_TEST(TreeWalkerTest, DirectorySymlinkIsNotFollowed)
{
  // Arrange
  const TempDirectory root;
  root.AddFile("real/inner.txt");
  std::filesystem::create_directory_symlink(
    root.Path() / "real", root.Path() / "link");

  // Act
  const auto files = ListFiles(root.Path());

  // Assert
  EXPECT_THAT(files, ElementsAre("link", "real/inner.txt"));
}

//! Test: walking a missing root throws.
NOLINT_TEST(TreeWalkerTest, MissingRootThrows)
{
  const TempDirectory root;

  NOLINT_EXPECT_THROW(
    (void)ListFiles(root.Path() / "missing"), std::filesystem::filesystem_error);
}

} // namespace
