//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <unordered_set>

#include <Replica/Ipc/Errors.h>
#include <Replica/Mirror/Receiver.h>

using replica::log::kDebugVerbosity;
using replica::mirror::Receiver;

Receiver::Receiver(Config config, ResultChannel& results,
  CollectionHandoff& handoff, log::Logger logger, ipc::CancelToken cancel)
  : config_(std::move(config))
  , results_(results)
  , handoff_(handoff)
  , logger_(std::move(logger))
  , cancel_(cancel)
{
}

auto Receiver::ToRelative(const std::string& absolute_path) const
  -> std::string
{
  return std::filesystem::path(absolute_path)
    .lexically_relative(config_.destination_root)
    .generic_string();
}

auto Receiver::Run() -> int
{
  ResultCollection collection;
  std::unordered_set<std::string> seen;
  try {
    while (true) {
      const auto message = results_.Receive(cancel_);
      if (const auto* done = std::get_if<TaskCompleted>(&message)) {
        auto relative = ToRelative(done->absolute_path);
        if (!seen.insert(relative).second) {
          ++collection.duplicates;
          logger_.Log(
            loguru::Verbosity_WARNING, "duplicate result for {}", relative);
          continue;
        }
        logger_.Log(kDebugVerbosity, "received {}", relative);
        collection.paths.push_back(std::move(relative));
      } else if (const auto* failed = std::get_if<TaskFailed>(&message)) {
        logger_.Log(loguru::Verbosity_WARNING, "task {} failed: {}",
          failed->relative_path, failed->reason);
        collection.failures.push_back(*failed);
      } else {
        break;
      }
    }
    logger_.Log(kDebugVerbosity,
      "result stream closed with {} results, {} failures, {} duplicates",
      collection.paths.size(), collection.failures.size(),
      collection.duplicates);
    handoff_.Deliver(collection, cancel_);
    return kDelivered;
  } catch (const ipc::OperationCancelled&) {
    logger_.Log(loguru::Verbosity_WARNING,
      "receiver cancelled after {} results", collection.paths.size());
    return kCancelled;
  } catch (const ipc::ChannelError& ex) {
    logger_.Log(loguru::Verbosity_ERROR, "receiver stopped: {}", ex.what());
    return kChannelFailure;
  }
}
