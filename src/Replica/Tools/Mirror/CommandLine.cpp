//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <charconv>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>

#include <getopt.h>

#include <fmt/format.h>

#include <Replica/Exec/ExecutionUnit.h>
#include <Replica/Log/Logger.h>
#include <Replica/Tools/Mirror/CommandLine.h>

using replica::tools::CommandLine;
using replica::tools::UsageError;

namespace {

// Long-only options.
enum : int {
  kDelayOption = 256,
  kWorkerUnitOption,
  kReceiverUnitOption,
  kLogUnitOption,
  kLogOption,
};

template <typename T>
auto ParseNumber(const std::string_view option, const std::string_view text)
  -> T
{
  T value {};
  const auto* const end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc {} || ptr != end || text.empty()) {
    throw UsageError(
      fmt::format("invalid value '{}' for option '{}'", text, option));
  }
  return value;
}

auto ParseUnit(const std::string_view option, const std::string_view text)
  -> replica::exec::UnitKind
{
  const auto kind = replica::exec::ParseUnitKind(text);
  if (!kind) {
    throw UsageError(fmt::format(
      "invalid value '{}' for option '{}', expected process or thread", text,
      option));
  }
  return *kind;
}

auto ParseLevel(const std::string_view text) -> loguru::Verbosity
{
  const auto verbosity = replica::log::ParseVerbosity(text);
  if (!verbosity) {
    throw UsageError(fmt::format("invalid log level '{}'", text));
  }
  return *verbosity;
}

} // namespace

auto replica::tools::Usage() -> std::string
{
  return fmt::format(
    "Usage: {0} [OPTIONS] SOURCE-DIR DESTINATION-DIR\n"
    "\n"
    "Mirrors the directory structure of SOURCE-DIR into the new directory\n"
    "DESTINATION-DIR, replacing every file with a placeholder of random\n"
    "letters, using a pool of concurrent workers.\n"
    "\n"
    "Options:\n"
    "  -n, --workers N         Number of workers (default: {1})\n"
    "      --delay MS          Delay before each task, in milliseconds\n"
    "      --worker-unit KIND  process or thread (default: {2})\n"
    "      --receiver-unit KIND\n"
    "                          process or thread (default: {3})\n"
    "      --log-unit KIND     process or thread (default: {4})\n"
    "      --log LEVEL         DEBUG, INFO, WARN, ERROR or a number\n"
    "  -d, --debug             Same as --log DEBUG\n"
    "  -h, --help              Show this help\n"
    "  -V, --version           Show the version\n",
    kProgramName, mirror::MirrorConfig {}.worker_count,
    to_string(mirror::MirrorConfig {}.worker_unit),
    to_string(mirror::MirrorConfig {}.receiver_unit),
    to_string(mirror::MirrorConfig {}.log_aggregator_unit));
}

auto replica::tools::ParseCommandLine(int argc, char** argv) -> CommandLine
{
  static const struct option long_options[] = {
    { "workers", required_argument, nullptr, 'n' },
    { "delay", required_argument, nullptr, kDelayOption },
    { "worker-unit", required_argument, nullptr, kWorkerUnitOption },
    { "receiver-unit", required_argument, nullptr, kReceiverUnitOption },
    { "log-unit", required_argument, nullptr, kLogUnitOption },
    { "log", required_argument, nullptr, kLogOption },
    { "debug", no_argument, nullptr, 'd' },
    { "help", no_argument, nullptr, 'h' },
    { "version", no_argument, nullptr, 'V' },
    { nullptr, 0, nullptr, 0 },
  };

  CommandLine command_line;
  auto& config = command_line.config;

  // Full reset of getopt's state, so that parsing can be repeated.
  optind = 0;
  opterr = 0;
  int option = 0;
  while ((option = getopt_long(argc, argv, ":n:dhV", long_options, nullptr))
    != -1) {
    const std::string_view value = optarg != nullptr ? optarg : "";
    switch (option) {
    case 'n':
      config.worker_count = ParseNumber<std::uint32_t>("--workers", value);
      if (config.worker_count == 0) {
        throw UsageError("--workers must be at least 1");
      }
      break;
    case kDelayOption:
      config.task_delay
        = std::chrono::milliseconds(ParseNumber<std::uint32_t>("--delay", value));
      break;
    case kWorkerUnitOption:
      config.worker_unit = ParseUnit("--worker-unit", value);
      break;
    case kReceiverUnitOption:
      config.receiver_unit = ParseUnit("--receiver-unit", value);
      break;
    case kLogUnitOption:
      config.log_aggregator_unit = ParseUnit("--log-unit", value);
      break;
    case kLogOption:
      config.verbosity = ParseLevel(value);
      break;
    case 'd':
      config.verbosity = log::kDebugVerbosity;
      break;
    case 'h':
      command_line.help = true;
      break;
    case 'V':
      command_line.version = true;
      break;
    case ':':
      throw UsageError(fmt::format("option '{}' requires a value",
        optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
    default:
      throw UsageError(fmt::format("unknown option '{}'",
        optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
    }
  }

  if (command_line.help || command_line.version) {
    return command_line;
  }

  const int remaining = argc - optind;
  if (remaining != 2) {
    throw UsageError(
      fmt::format("expected SOURCE-DIR and DESTINATION-DIR, got {} arguments",
        remaining));
  }
  std::error_code ec;
  command_line.source = std::filesystem::absolute(argv[optind], ec);
  if (!ec) {
    command_line.destination
      = std::filesystem::absolute(argv[optind + 1], ec);
  }
  if (ec) {
    throw UsageError(
      fmt::format("cannot resolve the arguments: {}", ec.message()));
  }
  return command_line;
}
