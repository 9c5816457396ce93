//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <Replica/Mirror/TreeWalker.h>

namespace fs = std::filesystem;

void replica::mirror::WalkTree(
  const fs::path& root, const std::function<void(const TreeEntry&)>& visit)
{
  for (auto it = fs::recursive_directory_iterator(root);
    it != fs::recursive_directory_iterator(); ++it) {
    const auto& entry = *it;
    TreeEntry visited {
      .relative_path = entry.path().lexically_relative(root).generic_string(),
      .is_directory = entry.is_directory() && !entry.is_symlink(),
    };
    visit(visited);
  }
}

auto replica::mirror::ListFiles(const fs::path& root)
  -> std::vector<std::string>
{
  std::vector<std::string> files;
  WalkTree(root, [&files](const TreeEntry& entry) {
    if (!entry.is_directory) {
      files.push_back(entry.relative_path);
    }
  });
  std::sort(files.begin(), files.end());
  return files;
}
