//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <filesystem>

#include <Replica/Base/Result.h>

namespace replica::mirror {

//! Creates or truncates `path` and fills it with `size` random ASCII letters.
//! The parent directory must exist.
[[nodiscard]] auto WritePlaceholder(
  const std::filesystem::path& path, std::size_t size) -> Result<void>;

} // namespace replica::mirror
