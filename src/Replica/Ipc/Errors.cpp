//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Replica/Ipc/Errors.h>

namespace replica::ipc {

auto GetIpcErrorCategory() noexcept -> const IpcErrorCategory&
{
  static IpcErrorCategory instance;
  return instance;
}

} // namespace replica::ipc
