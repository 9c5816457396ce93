//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <exception>

#include <Replica/Base/Logging.h>
#include <Replica/Exec/ExecutionUnit.h>
#include <Replica/Exec/ProcessUnit.h>
#include <Replica/Exec/ThreadUnit.h>

using replica::exec::ExecutionUnit;
using replica::exec::UnitKind;

auto replica::exec::to_string(const UnitKind kind) noexcept -> std::string_view
{
  switch (kind) {
  case UnitKind::kProcess:
    return "process";
  case UnitKind::kThread:
    return "thread";
  }
  return "__NotSupported__";
}

auto replica::exec::ParseUnitKind(const std::string_view text)
  -> std::optional<UnitKind>
{
  if (text == "process") {
    return UnitKind::kProcess;
  }
  if (text == "thread") {
    return UnitKind::kThread;
  }
  return std::nullopt;
}

ExecutionUnit::ExecutionUnit(std::string name, Body body)
  : name_(std::move(name))
  , body_(std::move(body))
{
  CHECK_F(static_cast<bool>(body_), "execution unit '{}' has no body", name_);
}

auto ExecutionUnit::RunBody(
  const std::function<void(std::string_view)>& report) noexcept -> int
{
  try {
    return body_();
  } catch (const std::exception& ex) {
    report(ex.what());
  } catch (...) {
    report("unknown exception");
  }
  return kUnhandledException;
}

auto replica::exec::MakeExecutionUnit(const UnitKind kind, std::string name,
  ExecutionUnit::Body body) -> std::unique_ptr<ExecutionUnit>
{
  switch (kind) {
  case UnitKind::kProcess:
    return std::make_unique<ProcessUnit>(std::move(name), std::move(body));
  case UnitKind::kThread:
    return std::make_unique<ThreadUnit>(std::move(name), std::move(body));
  }
  ABORT_F("unsupported execution unit kind {}", static_cast<int>(kind));
}
