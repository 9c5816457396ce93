//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace replica::ipc {

//! Protocol level errors raised by channels and the wire codec.
enum class IpcError : int {
  kMalformedMessage = 1,
  kMessageTooLarge,
  kUnknownTag,
  kCancelled,
  kPeerClosed,
  kAlreadyDelivered,
  kAlreadyTaken,
};

//! Category for IPC errors.
class IpcErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "Replica IPC Error";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override
  {
    switch (static_cast<IpcError>(ev)) {
    case IpcError::kMalformedMessage:
      return "message is truncated or carries trailing bytes";
    case IpcError::kMessageTooLarge:
      return "message exceeds the channel maximum message size";
    case IpcError::kUnknownTag:
      return "message carries an unknown variant tag";
    case IpcError::kCancelled:
      return "operation was cancelled";
    case IpcError::kPeerClosed:
      return "the other end of the channel was closed";
    case IpcError::kAlreadyDelivered:
      return "one-shot value was already delivered";
    case IpcError::kAlreadyTaken:
      return "one-shot value was already taken";
    default:
      return "unknown IPC error";
    }
  }
};

// Implemented in the .cpp so that error codes compare reliably by category
// identity.
[[nodiscard]] auto GetIpcErrorCategory() noexcept -> const IpcErrorCategory&;

inline auto make_error_code(IpcError e) noexcept -> std::error_code
{
  return { static_cast<int>(e), GetIpcErrorCategory() };
}

//! A channel operation failed: protocol violation or system call failure.
class ChannelError : public std::system_error {
public:
  ChannelError(std::error_code ec, const std::string& what)
    : std::system_error(ec, what)
  {
  }
};

//! A blocking channel operation was interrupted by cancellation.
class OperationCancelled : public std::system_error {
public:
  explicit OperationCancelled(const std::string& what)
    : std::system_error(make_error_code(IpcError::kCancelled), what)
  {
  }
};

} // namespace replica::ipc

template <>
struct std::is_error_code_enum<replica::ipc::IpcError> : true_type { };
