//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Replica/Mirror/Errors.h>

namespace replica::mirror {

auto GetMirrorErrorCategory() noexcept -> const MirrorErrorCategory&
{
  static MirrorErrorCategory instance;
  return instance;
}

auto ExitCodeFor(const MirrorError error) noexcept -> int
{
  switch (error) {
  case MirrorError::kPathError:
    return 2;
  case MirrorError::kCountMismatch:
    return 3;
  case MirrorError::kStructuralMismatch:
    return 4;
  case MirrorError::kWorkerWriteError:
    return 5;
  case MirrorError::kInterrupted:
    return 130;
  }
  return 1;
}

auto Severity(const MirrorError error) noexcept -> int
{
  switch (error) {
  case MirrorError::kCountMismatch:
    return 1;
  case MirrorError::kStructuralMismatch:
    return 2;
  case MirrorError::kWorkerWriteError:
    return 3;
  case MirrorError::kPathError:
  case MirrorError::kInterrupted:
    return 4;
  }
  return 0;
}

} // namespace replica::mirror
