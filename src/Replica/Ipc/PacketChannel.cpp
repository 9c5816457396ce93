//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cerrno>
#include <system_error>
#include <utility>

#include <poll.h>
#include <sys/socket.h>

#include <fmt/format.h>

#include <Replica/Base/Logging.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/PacketChannel.h>

using replica::ipc::ChannelError;
using replica::ipc::IpcError;
using replica::ipc::OperationCancelled;
using replica::ipc::PacketChannel;

namespace {

auto SystemError(const int err, const std::string& what) -> ChannelError
{
  return ChannelError(std::error_code(err, std::generic_category()), what);
}

} // namespace

void replica::ipc::detail::WaitReady(const int fd, const short events,
  const CancelToken& cancel, const std::string& operation)
{
  pollfd fds[2] = {
    { .fd = fd, .events = events, .revents = 0 },
    { .fd = cancel.NativeHandle(), .events = POLLIN, .revents = 0 },
  };
  const nfds_t count = cancel.CanBeCancelled() ? 2 : 1;
  while (true) {
    const int rc = ::poll(fds, count, -1);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw SystemError(errno, fmt::format("{}: poll", operation));
    }
    if (count == 2 && (fds[1].revents & POLLIN) != 0) {
      throw OperationCancelled(fmt::format("{} cancelled", operation));
    }
    // Readiness, hang-up or error: the retried operation reports which.
    if (fds[0].revents != 0) {
      return;
    }
  }
}

PacketChannel::PacketChannel(std::string name)
  : PacketChannel(std::move(name), Config {})
{
}

PacketChannel::PacketChannel(std::string name, Config config)
  : name_(std::move(name))
  , config_(config)
{
  CHECK_GT_F(config_.max_message_size, 0U);
  int fds[2] = { -1, -1 };
  if (::socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, fds) != 0) {
    throw SystemError(errno, fmt::format("{}: socketpair", name_));
  }
  send_fd_.Reset(fds[0]);
  receive_fd_.Reset(fds[1]);

  if (config_.buffer_size > 0) {
    const int size = static_cast<int>(config_.buffer_size);
    if (::setsockopt(
          send_fd_.Get(), SOL_SOCKET, SO_SNDBUF, &size, sizeof(size))
      != 0) {
      throw SystemError(errno, fmt::format("{}: SO_SNDBUF", name_));
    }
  }
  DLOG_F(2, "channel '{}' created (max message {} bytes, fds {}/{})", name_,
    config_.max_message_size, send_fd_.Get(), receive_fd_.Get());
}

auto PacketChannel::SendOnce(const std::span<const std::byte> packet)
  -> IoStatus
{
  if (packet.size() > config_.max_message_size) {
    throw ChannelError(make_error_code(IpcError::kMessageTooLarge),
      fmt::format("{}: message of {} bytes exceeds {}", name_, packet.size(),
        config_.max_message_size));
  }
  while (true) {
    const auto rc = ::send(send_fd_.Get(), packet.data(), packet.size(),
      MSG_DONTWAIT | MSG_NOSIGNAL);
    if (rc >= 0) {
      DCHECK_EQ_F(static_cast<std::size_t>(rc), packet.size());
      return IoStatus::kDone;
    }
    switch (errno) {
    case EINTR:
      continue;
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case ENOBUFS:
      return IoStatus::kWouldBlock;
    case EMSGSIZE:
      throw ChannelError(make_error_code(IpcError::kMessageTooLarge),
        fmt::format("{}: message of {} bytes rejected by the kernel", name_,
          packet.size()));
    case EPIPE:
    case ECONNRESET:
      throw ChannelError(make_error_code(IpcError::kPeerClosed),
        fmt::format("{}: send", name_));
    default:
      throw SystemError(errno, fmt::format("{}: send", name_));
    }
  }
}

auto PacketChannel::ReceiveOnce(std::vector<std::byte>& out) -> IoStatus
{
  // One byte more than the limit so that an oversized datagram is reported
  // instead of silently cut.
  thread_local std::vector<std::byte> scratch;
  scratch.resize(config_.max_message_size + 1);

  iovec iov { .iov_base = scratch.data(), .iov_len = scratch.size() };
  msghdr msg {};
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;

  while (true) {
    const auto rc = ::recvmsg(receive_fd_.Get(), &msg, MSG_DONTWAIT);
    if (rc > 0) {
      const auto size = static_cast<std::size_t>(rc);
      if ((msg.msg_flags & MSG_TRUNC) != 0
        || size > config_.max_message_size) {
        throw ChannelError(make_error_code(IpcError::kMessageTooLarge),
          fmt::format("{}: truncated datagram", name_));
      }
      out.assign(scratch.begin(), scratch.begin() + rc);
      return IoStatus::kDone;
    }
    if (rc == 0) {
      throw ChannelError(make_error_code(IpcError::kPeerClosed),
        fmt::format("{}: receive", name_));
    }
    switch (errno) {
    case EINTR:
      continue;
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return IoStatus::kWouldBlock;
    default:
      throw SystemError(errno, fmt::format("{}: recvmsg", name_));
    }
  }
}

void PacketChannel::Send(
  const std::span<const std::byte> packet, const CancelToken& cancel)
{
  const auto operation = fmt::format("{}: send", name_);
  cancel.ThrowIfCancelled(operation);
  while (SendOnce(packet) == IoStatus::kWouldBlock) {
    detail::WaitReady(send_fd_.Get(), POLLOUT, cancel, operation);
  }
}

auto PacketChannel::TrySend(const std::span<const std::byte> packet) -> bool
{
  return SendOnce(packet) == IoStatus::kDone;
}

auto PacketChannel::Receive(const CancelToken& cancel)
  -> std::vector<std::byte>
{
  const auto operation = fmt::format("{}: receive", name_);
  cancel.ThrowIfCancelled(operation);
  std::vector<std::byte> packet;
  while (ReceiveOnce(packet) == IoStatus::kWouldBlock) {
    detail::WaitReady(receive_fd_.Get(), POLLIN, cancel, operation);
  }
  return packet;
}

auto PacketChannel::TryReceive() -> std::optional<std::vector<std::byte>>
{
  std::vector<std::byte> packet;
  if (ReceiveOnce(packet) == IoStatus::kWouldBlock) {
    return std::nullopt;
  }
  return packet;
}
