//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <Replica/Base/Macros.h>

namespace replica::exec {

//! How a unit of the pipeline runs concurrently with the host.
enum class UnitKind {
  kProcess, //!< A forked child process.
  kThread, //!< A thread of the host process.
};

[[nodiscard]] auto to_string(UnitKind kind) noexcept -> std::string_view;

//! Parses "process" or "thread". Returns nothing for anything else.
[[nodiscard]] auto ParseUnitKind(std::string_view text)
  -> std::optional<UnitKind>;

//! Exit status reported by a unit whose body let an exception escape.
inline constexpr int kUnhandledException = 70;

/*!
  A concurrently running piece of the pipeline, started once and joined once.

  The body returns an exit status; `Join()` blocks until the body finished
  and returns that status. Whether the body runs on a thread or in a forked
  process is invisible to the caller, except that a process body shares
  nothing with the host but inherited descriptors and a copy of memory.

  A unit that is destroyed while running is joined by its destructor.
*/
class ExecutionUnit {
public:
  using Body = std::function<int()>;

  ExecutionUnit(std::string name, Body body);
  virtual ~ExecutionUnit() = default;

  REPLICA_MAKE_NON_COPYABLE(ExecutionUnit)
  REPLICA_MAKE_NON_MOVABLE(ExecutionUnit)

  //! Starts the body. Must be called at most once.
  virtual void Start() = 0;

  //! Waits for the body to finish and returns its exit status. Calling it
  //! again returns the same status.
  virtual auto Join() -> int = 0;

  [[nodiscard]] virtual auto Kind() const noexcept -> UnitKind = 0;

  [[nodiscard]] auto Name() const noexcept -> const std::string&
  {
    return name_;
  }

  [[nodiscard]] auto IsStarted() const noexcept { return started_; }
  [[nodiscard]] auto IsJoined() const noexcept { return status_.has_value(); }

  //! The status returned by Join(), if it already returned.
  [[nodiscard]] auto ExitStatus() const noexcept { return status_; }

protected:
  //! Runs the body, turning an escaping exception into kUnhandledException.
  //! `report` receives the exception text; it is not called otherwise.
  auto RunBody(const std::function<void(std::string_view)>& report) noexcept
    -> int;

  void MarkStarted() noexcept { started_ = true; }
  void MarkJoined(int status) noexcept { status_ = status; }

private:
  std::string name_;
  Body body_;
  bool started_ { false };
  std::optional<int> status_;
};

//! Creates an unstarted unit of the given kind.
[[nodiscard]] auto MakeExecutionUnit(
  UnitKind kind, std::string name, ExecutionUnit::Body body)
  -> std::unique_ptr<ExecutionUnit>;

} // namespace replica::exec
