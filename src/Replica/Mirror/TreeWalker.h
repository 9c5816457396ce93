//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace replica::mirror {

//! One entry below a walked root.
struct TreeEntry {
  //! Path relative to the root, with '/' separators.
  std::string relative_path;
  bool is_directory { false };
};

/*!
  Visits every entry below `root` in pre-order: a directory is visited before
  anything it contains. Symbolic links are not followed; a link to a
  directory is reported as a file entry.

  \throws std::filesystem::filesystem_error when the tree cannot be read.
*/
void WalkTree(const std::filesystem::path& root,
  const std::function<void(const TreeEntry&)>& visit);

//! Relative paths of every non-directory entry below `root`, sorted.
[[nodiscard]] auto ListFiles(const std::filesystem::path& root)
  -> std::vector<std::string>;

} // namespace replica::mirror
