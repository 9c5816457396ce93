//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <thread>

#include <Replica/Exec/ExecutionUnit.h>

namespace replica::exec {

//! Runs the body on a dedicated `std::thread` named after the unit.
class ThreadUnit final : public ExecutionUnit {
public:
  ThreadUnit(std::string name, Body body);
  ~ThreadUnit() override;

  REPLICA_MAKE_NON_COPYABLE(ThreadUnit)
  REPLICA_MAKE_NON_MOVABLE(ThreadUnit)

  void Start() override;
  auto Join() -> int override;

  [[nodiscard]] auto Kind() const noexcept -> UnitKind override
  {
    return UnitKind::kThread;
  }

private:
  std::thread thread_;
  int body_status_ { 0 };
};

} // namespace replica::exec
