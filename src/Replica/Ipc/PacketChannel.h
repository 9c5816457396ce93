//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <Replica/Base/Macros.h>
#include <Replica/Base/UniqueFd.h>
#include <Replica/Ipc/CancelToken.h>

namespace replica::ipc {

/*!
  Untyped multi-producer / multi-consumer queue of datagrams.

  Backed by an `AF_UNIX` `SOCK_SEQPACKET` socket pair: every `Send` is one
  atomic record and every `Receive` returns exactly one whole record, so any
  number of threads or forked processes may send and receive concurrently
  without extra locking. The queue is bounded by the kernel; a full queue
  blocks `Send` and an empty one blocks `Receive`.

  Both descriptors are kept open in every process for the lifetime of the
  channel. A blocking operation waits on the channel and on the optional
  CancelToken at once and throws OperationCancelled as soon as cancellation
  is requested.

  ### Failure Modes
  - Message larger than `Config::max_message_size`: ChannelError with
    `IpcError::kMessageTooLarge`.
  - Peer closed or truncated datagram: ChannelError.
  - Any other system call failure: ChannelError carrying the errno.
*/
class PacketChannel {
public:
  struct Config {
    //! Largest datagram accepted by Send and expected by Receive.
    std::size_t max_message_size { 16 * 1024 };
    //! SO_SNDBUF for the sending end; 0 keeps the kernel default.
    std::size_t buffer_size { 0 };
  };

  explicit PacketChannel(std::string name);
  PacketChannel(std::string name, Config config);
  ~PacketChannel() noexcept = default;

  REPLICA_MAKE_NON_COPYABLE(PacketChannel)
  REPLICA_DEFAULT_MOVABLE(PacketChannel)

  //! Blocks until the datagram is queued.
  void Send(std::span<const std::byte> packet, const CancelToken& cancel = {});

  //! Queues the datagram if there is room. Returns false when full.
  [[nodiscard]] auto TrySend(std::span<const std::byte> packet) -> bool;

  //! Blocks until a datagram is available and returns it.
  [[nodiscard]] auto Receive(const CancelToken& cancel = {})
    -> std::vector<std::byte>;

  //! Returns a queued datagram, or nothing when the queue is empty.
  [[nodiscard]] auto TryReceive() -> std::optional<std::vector<std::byte>>;

  [[nodiscard]] auto Name() const noexcept -> const std::string&
  {
    return name_;
  }

  [[nodiscard]] auto GetConfig() const noexcept -> const Config&
  {
    return config_;
  }

private:
  enum class IoStatus { kDone, kWouldBlock };

  auto SendOnce(std::span<const std::byte> packet) -> IoStatus;
  auto ReceiveOnce(std::vector<std::byte>& out) -> IoStatus;

  std::string name_;
  Config config_;
  UniqueFd send_fd_;
  UniqueFd receive_fd_;
};

namespace detail {

  //! Waits until `fd` reports `events` or `cancel` is signalled. Throws
  //! OperationCancelled naming `operation` in the latter case.
  void WaitReady(
    int fd, short events, const CancelToken& cancel, const std::string& operation);

} // namespace detail

} // namespace replica::ipc
