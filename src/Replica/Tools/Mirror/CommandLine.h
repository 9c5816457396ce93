//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include <Replica/Mirror/MirrorConfig.h>

namespace replica::tools {

inline constexpr std::string_view kProgramName = "replica-mirror";
inline constexpr std::string_view kVersion = "0.1";

//! The command line cannot be understood.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CommandLine {
  mirror::MirrorConfig config;
  std::filesystem::path source;
  std::filesystem::path destination;
  bool help { false };
  bool version { false };
};

/*!
  Parses `replica-mirror [options] <source-dir> <destination-dir>`.

  Source and destination are made absolute against the current directory.
  When `--help` or `--version` is given the positional arguments are not
  required. Throws UsageError for anything that is not understood.

  Uses getopt_long and therefore is not thread safe.
*/
[[nodiscard]] auto ParseCommandLine(int argc, char** argv) -> CommandLine;

[[nodiscard]] auto Usage() -> std::string;

} // namespace replica::tools
