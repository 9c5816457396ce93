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
#include <string_view>
#include <vector>

#include <Replica/Base/Result.h>

namespace replica::ipc {

/*!
  Builds one datagram: a tag byte followed by little-endian fixed width
  integers and length-prefixed strings.

  The encoding is independent of host byte order so that the same bytes
  travel between threads or between forked processes unchanged.
*/
class PacketWriter {
public:
  PacketWriter() = default;

  void WriteTag(std::uint8_t tag) { bytes_.push_back(std::byte { tag }); }
  void WriteU32(std::uint32_t value) { WriteLittleEndian(value, 4); }
  void WriteI32(std::int32_t value)
  {
    WriteLittleEndian(static_cast<std::uint32_t>(value), 4);
  }
  void WriteU64(std::uint64_t value) { WriteLittleEndian(value, 8); }
  void WriteI64(std::int64_t value)
  {
    WriteLittleEndian(static_cast<std::uint64_t>(value), 8);
  }

  //! Writes a `uint32` byte length followed by the raw bytes.
  void WriteString(std::string_view value);

  [[nodiscard]] auto Bytes() const noexcept -> std::span<const std::byte>
  {
    return bytes_;
  }
  [[nodiscard]] auto Size() const noexcept { return bytes_.size(); }

  auto Take() noexcept -> std::vector<std::byte> { return std::move(bytes_); }

private:
  void WriteLittleEndian(std::uint64_t value, std::size_t width);

  std::vector<std::byte> bytes_;
};

//! Reads back what PacketWriter produced. Every read fails with
//! `IpcError::kMalformedMessage` when the packet is too short.
class PacketReader {
public:
  explicit PacketReader(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
  {
  }

  auto ReadTag() -> Result<std::uint8_t>;
  auto ReadU32() -> Result<std::uint32_t>;
  auto ReadI32() -> Result<std::int32_t>;
  auto ReadU64() -> Result<std::uint64_t>;
  auto ReadI64() -> Result<std::int64_t>;
  auto ReadString() -> Result<std::string>;

  //! Succeeds only when every byte of the packet was consumed.
  [[nodiscard]] auto ExpectEnd() const -> Result<void>;

  [[nodiscard]] auto Remaining() const noexcept -> std::size_t
  {
    return bytes_.size() - offset_;
  }

private:
  auto ReadLittleEndian(std::size_t width) -> Result<std::uint64_t>;

  std::span<const std::byte> bytes_;
  std::size_t offset_ { 0 };
};

} // namespace replica::ipc
