//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <Replica/Base/Logging.h>
#include <Replica/Base/Macros.h>

namespace replica::testing {

//! Records loguru output for the lifetime of the object.
/*!
  Installs a loguru callback on construction and removes it on destruction.
  The log aggregator emits from its own thread, so captured messages are
  guarded by a mutex and accessors return copies.

  \code
  ScopedLogCapture capture { "aggregator", loguru::Verbosity_MAX };
  // ... run the pipeline ...
  EXPECT_EQ(capture.Count("wrote"), 3);
  \endcode
*/
class ScopedLogCapture {
public:
  explicit ScopedLogCapture(std::string id = "ScopedLogCapture",
    const loguru::Verbosity min_verbosity = loguru::Verbosity_MAX)
    : id_(std::move(id))
  {
    loguru::add_callback(
      id_.c_str(), &ScopedLogCapture::OnLog, this, min_verbosity);
  }

  ~ScopedLogCapture() { (void)loguru::remove_callback(id_.c_str()); }

  REPLICA_MAKE_NON_COPYABLE(ScopedLogCapture)
  REPLICA_MAKE_NON_MOVABLE(ScopedLogCapture)

  [[nodiscard]] auto Contains(std::string_view needle) const -> bool
  {
    return Count(needle) > 0;
  }

  //! Number of captured messages containing `needle`.
  [[nodiscard]] auto Count(std::string_view needle) const -> int
  {
    std::lock_guard lock(mutex_);
    int n = 0;
    for (const auto& msg : messages_) {
      if (msg.find(needle) != std::string::npos) {
        ++n;
      }
    }
    return n;
  }

  [[nodiscard]] auto Messages() const -> std::vector<std::string>
  {
    std::lock_guard lock(mutex_);
    return messages_;
  }

  void Clear()
  {
    std::lock_guard lock(mutex_);
    messages_.clear();
  }

private:
  static void OnLog(void* user_data, const loguru::Message& message)
  {
    auto* self = static_cast<ScopedLogCapture*>(user_data);
    if (self == nullptr || message.message == nullptr) {
      return;
    }
    std::lock_guard lock(self->mutex_);
    self->messages_.emplace_back(message.message);
  }

  std::string id_;
  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
};

} // namespace replica::testing
