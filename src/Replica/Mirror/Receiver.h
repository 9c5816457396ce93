//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <string>

#include <Replica/Ipc/CancelToken.h>
#include <Replica/Log/Logger.h>
#include <Replica/Mirror/Messages.h>

namespace replica::mirror {

/*!
  Sole consumer of the result queue.

  Collects the tree-relative path of every TaskCompleted, dropping and
  counting any path it already holds, and every TaskFailed. On
  ResultStreamEnd it hands the ResultCollection to the host through the
  one-shot channel, exactly once, and ends.

  Must be running before any worker starts, otherwise workers may block
  forever on a full result queue.
*/
class Receiver {
public:
  struct Config {
    //! Absolute destination root, used to relativize result paths.
    std::filesystem::path destination_root;
  };

  //! Delivered the collection after ResultStreamEnd.
  static constexpr int kDelivered = 0;
  static constexpr int kCancelled = 10;
  static constexpr int kChannelFailure = 11;

  Receiver(Config config, ResultChannel& results, CollectionHandoff& handoff,
    log::Logger logger, ipc::CancelToken cancel);

  auto Run() -> int;

private:
  [[nodiscard]] auto ToRelative(const std::string& absolute_path) const
    -> std::string;

  Config config_;
  ResultChannel& results_;
  CollectionHandoff& handoff_;
  log::Logger logger_;
  ipc::CancelToken cancel_;
};

} // namespace replica::mirror
