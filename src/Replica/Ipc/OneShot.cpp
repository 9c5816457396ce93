//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <cerrno>
#include <cstdint>
#include <system_error>
#include <utility>

#include <poll.h>
#include <sys/socket.h>

#include <Replica/Base/Logging.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/OneShot.h>
#include <Replica/Ipc/PacketChannel.h>
#include <Replica/Ipc/Wire.h>

using replica::ipc::ChannelError;
using replica::ipc::IpcError;
using replica::ipc::OneShotChannel;
using replica::ipc::OperationCancelled;

namespace {

constexpr std::size_t kHeaderSize = sizeof(std::uint64_t);

auto SystemError(const int err, const std::string& what) -> ChannelError
{
  return ChannelError(std::error_code(err, std::generic_category()), what);
}

} // namespace

OneShotChannel::OneShotChannel(std::string name)
  : name_(std::move(name))
{
  int fds[2] = { -1, -1 };
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    throw SystemError(errno, fmt::format("{}: socketpair", name_));
  }
  write_fd_.Reset(fds[0]);
  read_fd_.Reset(fds[1]);
}

void OneShotChannel::Deliver(
  const std::span<const std::byte> payload, const CancelToken& cancel)
{
  const auto operation = fmt::format("{}: deliver", name_);
  if (delivered_.exchange(true)) {
    throw ChannelError(make_error_code(IpcError::kAlreadyDelivered), operation);
  }

  PacketWriter frame;
  frame.WriteU64(payload.size());
  const auto header = frame.Take();

  std::size_t total_sent = 0;
  try {
    cancel.ThrowIfCancelled(operation);
    for (const auto part : { std::span<const std::byte>(header), payload }) {
      std::size_t sent = 0;
      while (sent < part.size()) {
        const auto rc = ::send(write_fd_.Get(), part.data() + sent,
          part.size() - sent, MSG_DONTWAIT | MSG_NOSIGNAL);
        if (rc >= 0) {
          sent += static_cast<std::size_t>(rc);
          total_sent += static_cast<std::size_t>(rc);
          continue;
        }
        if (errno == EINTR) {
          continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          detail::WaitReady(write_fd_.Get(), POLLOUT, cancel, operation);
          continue;
        }
        throw SystemError(errno, operation);
      }
    }
  } catch (const OperationCancelled&) {
    // Nothing reached the reader: the value can still be delivered.
    if (total_sent == 0) {
      delivered_ = false;
    }
    throw;
  }
}

auto OneShotChannel::ReadSome(const std::span<std::byte> buffer,
  const bool blocking, const CancelToken& cancel) -> std::size_t
{
  const auto operation = fmt::format("{}: take", name_);
  std::size_t received = 0;
  while (received < buffer.size()) {
    const auto rc = ::recv(read_fd_.Get(), buffer.data() + received,
      buffer.size() - received, MSG_DONTWAIT);
    if (rc > 0) {
      received += static_cast<std::size_t>(rc);
      continue;
    }
    if (rc == 0) {
      throw ChannelError(make_error_code(IpcError::kPeerClosed), operation);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      if (!blocking) {
        break;
      }
      detail::WaitReady(read_fd_.Get(), POLLIN, cancel, operation);
      continue;
    }
    throw SystemError(errno, operation);
  }
  return received;
}

auto OneShotChannel::Take(const CancelToken& cancel) -> std::vector<std::byte>
{
  const auto operation = fmt::format("{}: take", name_);
  if (taken_.exchange(true)) {
    throw ChannelError(make_error_code(IpcError::kAlreadyTaken), operation);
  }
  // Until the first byte is consumed a cancelled take leaves the value in
  // place for a later TryTake().
  try {
    cancel.ThrowIfCancelled(operation);
    detail::WaitReady(read_fd_.Get(), POLLIN, cancel, operation);
  } catch (const OperationCancelled&) {
    taken_ = false;
    throw;
  }

  std::array<std::byte, kHeaderSize> header {};
  (void)ReadSome(header, true, cancel);
  PacketReader reader(header);
  const auto size = reader.ReadU64().value();

  std::vector<std::byte> payload(size);
  (void)ReadSome(payload, true, cancel);
  return payload;
}

auto OneShotChannel::TryTake() -> std::optional<std::vector<std::byte>>
{
  if (taken_.load()) {
    throw ChannelError(make_error_code(IpcError::kAlreadyTaken),
      fmt::format("{}: take", name_));
  }

  std::array<std::byte, kHeaderSize> header {};
  const auto got = ReadSome(header, false, {});
  if (got == 0) {
    return std::nullopt;
  }
  taken_ = true;
  if (got < header.size()) {
    LOG_F(WARNING, "{}: discarding partial one-shot header", name_);
    return std::nullopt;
  }
  PacketReader reader(header);
  const auto size = reader.ReadU64().value();
  std::vector<std::byte> payload(size);
  if (ReadSome(payload, false, {}) < size) {
    LOG_F(WARNING, "{}: discarding partial one-shot payload of {} bytes",
      name_, size);
    return std::nullopt;
  }
  return payload;
}
