//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <Replica/Base/Logging.h>
#include <Replica/Exec/ExecutionUnit.h>

namespace replica::mirror {

//! Settings of one mirror run.
struct MirrorConfig {
  //! Number of workers, and of stop markers published. Must be positive.
  std::uint32_t worker_count { 5 };

  //! Artificial delay before each task, for latency and backpressure
  //! experiments. The delay is cancellable.
  std::optional<std::chrono::milliseconds> task_delay;

  exec::UnitKind worker_unit { exec::UnitKind::kProcess };
  exec::UnitKind receiver_unit { exec::UnitKind::kThread };
  exec::UnitKind log_aggregator_unit { exec::UnitKind::kThread };

  //! Most verbose level published by pipeline components.
  loguru::Verbosity verbosity { loguru::Verbosity_INFO };

  //! Size in bytes of every placeholder file.
  std::size_t placeholder_size { 1024 };

  //! Rows shown when verification finds a divergence.
  std::size_t divergence_window { 16 };

  //! Bound on the non-blocking drain passes made while aborting.
  std::uint32_t drain_attempts { 64 };

  //! SO_SNDBUF of the work, result and log queues; 0 keeps the kernel
  //! default.
  std::size_t queue_buffer_bytes { 0 };
};

} // namespace replica::mirror
