//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <Replica/Base/Logging.h>
#include <Replica/Exec/InterruptHandler.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Mirror/Errors.h>
#include <Replica/Mirror/Replicator.h>
#include <Replica/Tools/Mirror/CommandLine.h>

namespace {

constexpr int kExitUsage = 64;
constexpr int kExitInternal = 1;

auto Summary(const replica::mirror::MirrorReport& report) -> std::string
{
  auto line = fmt::format(
    "{} tasks, {} results, {} failures, {} directories, {} workers, "
    "verification {}",
    report.tasks_published, report.results_received, report.failures.size(),
    report.directories_created, report.workers_joined,
    report.verification.matched ? "passed" : "failed");
  if (report.Succeeded()) {
    return line;
  }
  const char* separator = ": ";
  for (const auto error : report.Errors()) {
    line += separator + make_error_code(error).message();
    separator = "; ";
  }
  return line;
}

auto RunMirror(const replica::tools::CommandLine& command_line) -> int
{
  using replica::mirror::ExitCodeFor;

  replica::mirror::Replicator replicator(
    command_line.source, command_line.destination, command_line.config);
  const replica::exec::ScopedInterruptHandler interrupts(
    replicator.GetCancelSource());

  LOG_F(INFO, "Start running");
  const auto report = replicator.Run();
  LOG_F(INFO, "Finished running");

  std::cout << Summary(report) << "\n";
  const auto worst = report.WorstError();
  return worst ? ExitCodeFor(*worst) : 0;
}

} // namespace

auto main(int argc, char** argv) -> int
{
  using replica::mirror::ExitCodeFor;
  using replica::mirror::MirrorError;

  loguru::g_preamble_date = false;
  loguru::g_preamble_file = false;
  loguru::g_preamble_verbose = false;
  loguru::g_preamble_time = true;
  loguru::g_preamble_uptime = false;
  loguru::g_preamble_thread = true;
  loguru::g_preamble_header = false;
  loguru::g_stderr_verbosity = loguru::Verbosity_INFO;

  loguru::init(argc, argv);
  loguru::set_thread_name("main");

  int exit_code = 0;
  try {
    const auto command_line = replica::tools::ParseCommandLine(argc, argv);
    if (command_line.help) {
      std::cout << replica::tools::Usage();
    } else if (command_line.version) {
      std::cout << replica::tools::kProgramName << " "
                << replica::tools::kVersion << "\n";
    } else {
      loguru::g_stderr_verbosity = command_line.config.verbosity;
      exit_code = RunMirror(command_line);
    }
  } catch (const replica::tools::UsageError& ex) {
    std::cerr << replica::tools::kProgramName << ": " << ex.what() << "\n\n"
              << replica::tools::Usage();
    exit_code = kExitUsage;
  } catch (const std::invalid_argument& ex) {
    std::cerr << "ERROR: " << ex.what() << "\n";
    exit_code = kExitUsage;
  } catch (const replica::mirror::PathError& ex) {
    std::cerr << "ERROR: " << ex.what() << "\n";
    exit_code = ExitCodeFor(MirrorError::kPathError);
  } catch (const replica::mirror::Interrupted& ex) {
    std::cerr << "ERROR: " << ex.what() << "\n";
    exit_code = ExitCodeFor(MirrorError::kInterrupted);
  } catch (const std::exception& ex) {
    std::cerr << "ERROR: " << ex.what() << "\n";
    exit_code = kExitInternal;
  }

  loguru::flush();
  loguru::g_global_verbosity = loguru::Verbosity_OFF;
  loguru::shutdown();

  return exit_code;
}
