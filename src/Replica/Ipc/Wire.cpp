//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <limits>

#include <Replica/Base/Logging.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/Wire.h>

using replica::Result;
using replica::ipc::IpcError;
using replica::ipc::PacketReader;
using replica::ipc::PacketWriter;

void PacketWriter::WriteLittleEndian(
  const std::uint64_t value, const std::size_t width)
{
  for (std::size_t i = 0; i < width; ++i) {
    bytes_.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFFU));
  }
}

void PacketWriter::WriteString(const std::string_view value)
{
  CHECK_F(value.size() <= std::numeric_limits<std::uint32_t>::max(),
    "string of {} bytes does not fit a wire length prefix", value.size());
  WriteU32(static_cast<std::uint32_t>(value.size()));
  const auto* first = reinterpret_cast<const std::byte*>(value.data());
  bytes_.insert(bytes_.end(), first, first + value.size());
}

auto PacketReader::ReadLittleEndian(const std::size_t width)
  -> Result<std::uint64_t>
{
  if (Remaining() < width) {
    return make_error_code(IpcError::kMalformedMessage);
  }
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    value |= std::to_integer<std::uint64_t>(bytes_[offset_ + i]) << (8 * i);
  }
  offset_ += width;
  return value;
}

auto PacketReader::ReadTag() -> Result<std::uint8_t>
{
  const auto value = ReadLittleEndian(1);
  CHECK_RESULT(value);
  return static_cast<std::uint8_t>(value.value());
}

auto PacketReader::ReadU32() -> Result<std::uint32_t>
{
  const auto value = ReadLittleEndian(4);
  CHECK_RESULT(value);
  return static_cast<std::uint32_t>(value.value());
}

auto PacketReader::ReadI32() -> Result<std::int32_t>
{
  const auto value = ReadU32();
  CHECK_RESULT(value);
  return static_cast<std::int32_t>(value.value());
}

auto PacketReader::ReadU64() -> Result<std::uint64_t>
{
  return ReadLittleEndian(8);
}

auto PacketReader::ReadI64() -> Result<std::int64_t>
{
  const auto value = ReadLittleEndian(8);
  CHECK_RESULT(value);
  return static_cast<std::int64_t>(value.value());
}

auto PacketReader::ReadString() -> Result<std::string>
{
  const auto length = ReadU32();
  CHECK_RESULT(length);
  if (Remaining() < length.value()) {
    return make_error_code(IpcError::kMalformedMessage);
  }
  const auto* first = reinterpret_cast<const char*>(bytes_.data() + offset_);
  std::string value(first, length.value());
  offset_ += length.value();
  return value;
}

auto PacketReader::ExpectEnd() const -> Result<void>
{
  if (Remaining() != 0) {
    return make_error_code(IpcError::kMalformedMessage);
  }
  return {};
}
