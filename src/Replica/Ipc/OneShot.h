//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <Replica/Base/Macros.h>
#include <Replica/Base/UniqueFd.h>
#include <Replica/Ipc/CancelToken.h>
#include <Replica/Ipc/Channel.h>
#include <Replica/Ipc/Errors.h>

namespace replica::ipc {

/*!
  Single-producer / single-consumer handoff of one byte payload, written
  exactly once and read exactly once.

  Backed by an `AF_UNIX` `SOCK_STREAM` socket pair so that the producer may
  live in a forked process. The payload is framed with a `uint64`
  little-endian length. `Take()` blocks until the whole payload arrived;
  `Deliver()` blocks while the payload does not fit the socket buffer, so the
  consumer must be taking concurrently for large payloads.

  Exactly-once is enforced per side: a second `Deliver()` in the producing
  unit, or a second `Take()` in the consuming unit, throws ChannelError. A
  `Take()` or `Deliver()` cancelled before any byte was transferred does not
  count and may be repeated.
*/
class OneShotChannel {
public:
  explicit OneShotChannel(std::string name);
  ~OneShotChannel() noexcept = default;

  REPLICA_MAKE_NON_COPYABLE(OneShotChannel)
  REPLICA_MAKE_NON_MOVABLE(OneShotChannel)

  void Deliver(std::span<const std::byte> payload, const CancelToken& cancel = {});

  [[nodiscard]] auto Take(const CancelToken& cancel = {})
    -> std::vector<std::byte>;

  //! Non-blocking take. Returns nothing when no complete payload is
  //! available; a partially written payload is discarded.
  [[nodiscard]] auto TryTake() -> std::optional<std::vector<std::byte>>;

  [[nodiscard]] auto IsDelivered() const noexcept -> bool
  {
    return delivered_.load();
  }
  [[nodiscard]] auto IsTaken() const noexcept -> bool { return taken_.load(); }

  [[nodiscard]] auto Name() const noexcept -> const std::string&
  {
    return name_;
  }

private:
  //! Reads up to `buffer.size()` bytes. Returns the count read, which is
  //! short only when `blocking` is false and no more data is queued.
  auto ReadSome(std::span<std::byte> buffer, bool blocking,
    const CancelToken& cancel) -> std::size_t;

  std::string name_;
  UniqueFd write_fd_;
  UniqueFd read_fd_;
  std::atomic<bool> delivered_ { false };
  std::atomic<bool> taken_ { false };
};

//! Typed one-shot over OneShotChannel, using the MessageCodec of `T`.
template <WireMessage T> class OneShot {
public:
  explicit OneShot(std::string name)
    : channel_(std::move(name))
  {
  }

  void Deliver(const T& value, const CancelToken& cancel = {})
  {
    channel_.Deliver(MessageCodec<T>::Encode(value), cancel);
  }

  [[nodiscard]] auto Take(const CancelToken& cancel = {}) -> T
  {
    return Decode(channel_.Take(cancel));
  }

  [[nodiscard]] auto TryTake() -> std::optional<T>
  {
    auto payload = channel_.TryTake();
    if (!payload) {
      return std::nullopt;
    }
    return Decode(*payload);
  }

  [[nodiscard]] auto IsDelivered() const noexcept
  {
    return channel_.IsDelivered();
  }
  [[nodiscard]] auto IsTaken() const noexcept { return channel_.IsTaken(); }

private:
  auto Decode(const std::vector<std::byte>& payload) const -> T
  {
    auto decoded = MessageCodec<T>::Decode(payload);
    if (!decoded) {
      throw ChannelError(decoded.error(),
        fmt::format("{}: cannot decode {} byte payload", channel_.Name(),
          payload.size()));
    }
    return decoded.move_value();
  }

  OneShotChannel channel_;
};

} // namespace replica::ipc
