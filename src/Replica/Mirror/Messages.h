//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <Replica/Base/Result.h>
#include <Replica/Ipc/Channel.h>
#include <Replica/Ipc/OneShot.h>

namespace replica::mirror {

//! Work item: the tree-relative path of one file to mirror.
struct Task {
  std::string relative_path;

  auto operator==(const Task&) const -> bool = default;
};

//! Tells the worker that receives it to stop. One is published per worker.
struct StopMarker {
  auto operator==(const StopMarker&) const -> bool = default;
};

using WorkMessage = std::variant<Task, StopMarker>;

//! A placeholder was written; carries its absolute path.
struct TaskCompleted {
  std::string absolute_path;

  auto operator==(const TaskCompleted&) const -> bool = default;
};

//! A placeholder could not be written. The task is not retried.
struct TaskFailed {
  std::string relative_path;
  std::string reason;

  auto operator==(const TaskFailed&) const -> bool = default;
};

//! Tells the receiver that no more results will be published.
struct ResultStreamEnd {
  auto operator==(const ResultStreamEnd&) const -> bool = default;
};

using ResultMessage = std::variant<TaskCompleted, TaskFailed, ResultStreamEnd>;

//! What the receiver hands back to the host once the result stream ended.
struct ResultCollection {
  //! Tree-relative paths of completed tasks, without duplicates, in arrival
  //! order.
  std::vector<std::string> paths;
  std::vector<TaskFailed> failures;
  //! Results dropped because their path was already collected.
  std::uint32_t duplicates { 0 };

  auto operator==(const ResultCollection&) const -> bool = default;
};

} // namespace replica::mirror

namespace replica::ipc {

template <> struct MessageCodec<mirror::WorkMessage> {
  static auto Encode(const mirror::WorkMessage& message)
    -> std::vector<std::byte>;
  static auto Decode(std::span<const std::byte> bytes)
    -> Result<mirror::WorkMessage>;
};

template <> struct MessageCodec<mirror::ResultMessage> {
  static auto Encode(const mirror::ResultMessage& message)
    -> std::vector<std::byte>;
  static auto Decode(std::span<const std::byte> bytes)
    -> Result<mirror::ResultMessage>;
};

template <> struct MessageCodec<mirror::ResultCollection> {
  static auto Encode(const mirror::ResultCollection& collection)
    -> std::vector<std::byte>;
  static auto Decode(std::span<const std::byte> bytes)
    -> Result<mirror::ResultCollection>;
};

} // namespace replica::ipc

namespace replica::mirror {

// Declared after the codecs: the channel templates require them.
using WorkChannel = ipc::Channel<WorkMessage>;
using ResultChannel = ipc::Channel<ResultMessage>;
using CollectionHandoff = ipc::OneShot<ResultCollection>;

} // namespace replica::mirror
