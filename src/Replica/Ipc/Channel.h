//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <Replica/Base/Result.h>
#include <Replica/Ipc/CancelToken.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/PacketChannel.h>

namespace replica::ipc {

//! Customization point: specialize with static `Encode` and `Decode` for
//! every message type carried by a Channel.
template <typename T> struct MessageCodec;

template <typename T>
concept WireMessage = requires(const T& value, std::span<const std::byte> bytes) {
  { MessageCodec<T>::Encode(value) } -> std::same_as<std::vector<std::byte>>;
  { MessageCodec<T>::Decode(bytes) } -> std::same_as<Result<T>>;
};

/*!
  Typed queue of `T` messages over a PacketChannel.

  Each message is encoded into one datagram with its MessageCodec. A datagram
  that fails to decode is a protocol violation and raises ChannelError with
  the decoder's error code.

  The same object is shared by reference between threads, and survives
  `fork` so that a child process uses it exactly like a thread does.
*/
template <WireMessage T> class Channel {
public:
  using Config = PacketChannel::Config;
  using ValueType = T;

  explicit Channel(std::string name)
    : packets_(std::move(name))
  {
  }

  Channel(std::string name, Config config)
    : packets_(std::move(name), config)
  {
  }

  void Send(const T& message, const CancelToken& cancel = {})
  {
    const auto bytes = MessageCodec<T>::Encode(message);
    packets_.Send(bytes, cancel);
  }

  [[nodiscard]] auto TrySend(const T& message) -> bool
  {
    const auto bytes = MessageCodec<T>::Encode(message);
    return packets_.TrySend(bytes);
  }

  [[nodiscard]] auto Receive(const CancelToken& cancel = {}) -> T
  {
    return Decode(packets_.Receive(cancel));
  }

  [[nodiscard]] auto TryReceive() -> std::optional<T>
  {
    auto packet = packets_.TryReceive();
    if (!packet) {
      return std::nullopt;
    }
    return Decode(*packet);
  }

  [[nodiscard]] auto Name() const noexcept -> const std::string&
  {
    return packets_.Name();
  }

private:
  auto Decode(const std::vector<std::byte>& packet) const -> T
  {
    auto decoded = MessageCodec<T>::Decode(packet);
    if (!decoded) {
      throw ChannelError(decoded.error(),
        fmt::format("{}: cannot decode {} byte message", Name(), packet.size()));
    }
    return decoded.move_value();
  }

  PacketChannel packets_;
};

} // namespace replica::ipc
