//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <unistd.h>

#include <Replica/Base/UniqueFd.h>

using replica::UniqueFd;

void UniqueFd::Reset(const int fd) noexcept
{
  if (fd_ >= 0 && fd_ != fd) {
    // On Linux the descriptor is released even when close() reports EINTR,
    // so it must not be retried.
    (void)::close(fd_);
  }
  fd_ = fd;
}
