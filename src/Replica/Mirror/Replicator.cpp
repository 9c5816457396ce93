//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include <Replica/Base/Logging.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Mirror/Replicator.h>
#include <Replica/Mirror/TreeWalker.h>

namespace fs = std::filesystem;

using replica::log::kDebugVerbosity;
using replica::mirror::MirrorError;
using replica::mirror::MirrorReport;
using replica::mirror::Replicator;
using replica::mirror::ResultCollection;

namespace {

auto Normalize(const fs::path& path) -> fs::path
{
  auto normal = fs::absolute(path).lexically_normal();
  if (!normal.has_filename() && normal.has_parent_path()
    && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

//! True when `path` is `ancestor` or lies below it.
auto IsWithin(const fs::path& path, const fs::path& ancestor) -> bool
{
  if (ancestor.empty()) {
    return false;
  }
  return std::mismatch(
           ancestor.begin(), ancestor.end(), path.begin(), path.end())
           .first
    == ancestor.end();
}

} // namespace

auto MirrorReport::Errors() const -> std::vector<MirrorError>
{
  std::vector<MirrorError> errors;
  if (count_mismatch) {
    errors.push_back(MirrorError::kCountMismatch);
  }
  if (!verification.matched) {
    errors.push_back(MirrorError::kStructuralMismatch);
  }
  if (!failures.empty()) {
    errors.push_back(MirrorError::kWorkerWriteError);
  }
  return errors;
}

auto MirrorReport::WorstError() const -> std::optional<MirrorError>
{
  const auto errors = Errors();
  if (errors.empty()) {
    return std::nullopt;
  }
  return *std::max_element(errors.begin(), errors.end(),
    [](const MirrorError a, const MirrorError b) {
      return Severity(a) < Severity(b);
    });
}

Replicator::Replicator(
  fs::path source, fs::path destination, MirrorConfig config)
  : source_(Normalize(source))
  , destination_(Normalize(destination))
  , config_(std::move(config))
{
}

Replicator::~Replicator()
{
  const auto outstanding = [](const auto& unit) {
    return unit && unit->IsStarted() && !unit->IsJoined();
  };
  if (outstanding(receiver_unit_)
    || std::any_of(worker_units_.begin(), worker_units_.end(), outstanding)) {
    LOG_F(WARNING, "replicator destroyed with running units, cancelling");
    cancel_.RequestCancel();
  }
}

void Replicator::ValidateConfig() const
{
  if (config_.worker_count == 0) {
    throw std::invalid_argument("worker count must be positive");
  }
  if (config_.task_delay && config_.task_delay->count() < 0) {
    throw std::invalid_argument("task delay must not be negative");
  }
}

void Replicator::ValidatePaths() const
{
  std::error_code ec;
  if (!fs::is_directory(source_, ec)) {
    throw PathError(source_,
      fmt::format("source '{}' is not an existing directory", source_.string()));
  }
  if (fs::exists(fs::symlink_status(destination_, ec))) {
    throw PathError(destination_,
      fmt::format("destination '{}' already exists", destination_.string()));
  }
  if (!fs::is_directory(destination_.parent_path(), ec)) {
    throw PathError(destination_,
      fmt::format("parent of destination '{}' is not an existing directory",
        destination_.string()));
  }
  std::error_code source_ec;
  std::error_code destination_ec;
  const auto real_source = fs::canonical(source_, source_ec);
  const auto real_destination
    = fs::weakly_canonical(destination_, destination_ec);
  if (!source_ec && !destination_ec
    && IsWithin(real_destination, real_source)) {
    throw PathError(destination_,
      fmt::format("destination '{}' lies inside source '{}'",
        destination_.string(), source_.string()));
  }
}

void Replicator::CreatePipeline()
{
  const ipc::PacketChannel::Config queue { .buffer_size
    = config_.queue_buffer_bytes };
  log_channel_ = std::make_unique<log::LogChannel>("log", queue);
  work_ = std::make_unique<WorkChannel>("work", queue);
  results_ = std::make_unique<ResultChannel>("results", queue);
  handoff_ = std::make_unique<CollectionHandoff>("collection");
  logger_ = log::Logger(*log_channel_, "host", config_.verbosity);

  aggregator_ = std::make_unique<log::LogAggregator>(*log_channel_,
    log::LogAggregator::Config { .unit = config_.log_aggregator_unit });
  receiver_ = std::make_unique<Receiver>(
    Receiver::Config { .destination_root = destination_ }, *results_,
    *handoff_, logger_.WithOrigin("receiver"), cancel_.Token());
  for (std::uint32_t id = 0; id < config_.worker_count; ++id) {
    workers_.push_back(std::make_unique<Worker>(
      Worker::Config {
        .id = id,
        .destination_root = destination_,
        .placeholder_size = config_.placeholder_size,
        .task_delay = config_.task_delay,
      },
      *work_, *results_, logger_.WithOrigin(fmt::format("worker-{}", id)),
      cancel_.Token()));
  }
}

void Replicator::StartUnit(exec::ExecutionUnit& unit)
{
  unit.Start();
  if (observer_ != nullptr) {
    observer_->OnUnitStarted(unit.Name(), unit.Kind());
  }
}

void Replicator::StartPipeline()
{
  // Order matters: the aggregator must drain before anyone logs, and the
  // receiver must consume before any worker can publish a result.
  aggregator_->Start();
  if (observer_ != nullptr) {
    observer_->OnUnitStarted("log-aggregator", config_.log_aggregator_unit);
  }

  receiver_unit_ = exec::MakeExecutionUnit(config_.receiver_unit, "receiver",
    [receiver = receiver_.get()] { return receiver->Run(); });
  StartUnit(*receiver_unit_);

  for (const auto& worker : workers_) {
    auto unit = exec::MakeExecutionUnit(config_.worker_unit,
      fmt::format("worker-{}", worker_units_.size()),
      [worker = worker.get()] { return worker->Run(); });
    worker_units_.push_back(std::move(unit));
    StartUnit(*worker_units_.back());
  }
  logger_.Log(loguru::Verbosity_INFO,
    "pipeline started: {} {} workers, {} receiver, {} log aggregator",
    config_.worker_count, to_string(config_.worker_unit),
    to_string(config_.receiver_unit), to_string(config_.log_aggregator_unit));
}

void Replicator::PublishTree(MirrorReport& report)
{
  const auto cancel = cancel_.Token();
  WalkTree(source_, [&](const TreeEntry& entry) {
    if (entry.is_directory) {
      cancel.ThrowIfCancelled("tree walk");
      fs::create_directory(destination_ / entry.relative_path);
      ++report.directories_created;
      logger_.Log(kDebugVerbosity, "created directory {}", entry.relative_path);
      return;
    }
    logger_.Log(kDebugVerbosity, "Pushing {}", entry.relative_path);
    work_->Send(Task { entry.relative_path }, cancel);
    ++report.tasks_published;
    if (observer_ != nullptr) {
      observer_->OnTaskPublished(entry.relative_path);
    }
  });
  logger_.Log(loguru::Verbosity_INFO, "published {} tasks, created {} directories",
    report.tasks_published, report.directories_created);
}

void Replicator::PublishStopMarkers(MirrorReport& report)
{
  const auto cancel = cancel_.Token();
  for (std::uint32_t i = 0; i < config_.worker_count; ++i) {
    work_->Send(StopMarker {}, cancel);
    ++report.stop_markers_published;
    if (observer_ != nullptr) {
      observer_->OnStopMarkerPublished(i);
    }
  }
}

void Replicator::JoinWorkers(MirrorReport& report)
{
  for (const auto& unit : worker_units_) {
    const int status = unit->Join();
    ++report.workers_joined;
    if (status == Worker::kStopped) {
      ++report.stop_markers_consumed;
    } else {
      logger_.Log(loguru::Verbosity_WARNING, "{} ended with status {}",
        unit->Name(), status);
    }
    if (observer_ != nullptr) {
      observer_->OnWorkerJoined(unit->Name(), status);
    }
  }
}

auto Replicator::CollectResults() -> ResultCollection
{
  results_->Send(ResultStreamEnd {}, cancel_.Token());
  if (observer_ != nullptr) {
    observer_->OnResultStreamClosed();
  }

  auto collection = handoff_->Take(cancel_.Token());
  if (observer_ != nullptr) {
    observer_->OnCollectionReceived(collection);
  }
  if (const int status = receiver_unit_->Join();
    status != Receiver::kDelivered) {
    logger_.Log(
      loguru::Verbosity_WARNING, "receiver ended with status {}", status);
  }
  return collection;
}

void Replicator::Evaluate(
  const ResultCollection& collection, MirrorReport& report)
{
  report.results_received = collection.paths.size() + collection.duplicates;
  report.failures = collection.failures;
  report.duplicates = collection.duplicates;
  report.count_mismatch = collection.duplicates != 0
    || report.results_received + report.failures.size()
      != report.tasks_published;
  if (report.count_mismatch) {
    logger_.Log(loguru::Verbosity_ERROR,
      "published {} tasks but received {} results and {} failures",
      report.tasks_published, report.results_received,
      report.failures.size());
  }
  for (const auto& failure : report.failures) {
    logger_.Log(loguru::Verbosity_ERROR, "not mirrored: {} ({})",
      failure.relative_path, failure.reason);
  }

  report.verification = VerifyTrees(
    source_, destination_, collection.paths, config_.divergence_window);
  if (report.verification.matched) {
    logger_.Log(loguru::Verbosity_INFO, "verification passed: {} files",
      report.verification.source_count);
    return;
  }
  logger_.Log(loguru::Verbosity_ERROR,
    "verification failed: {} source, {} destination, {} result entries",
    report.verification.source_count, report.verification.destination_count,
    report.verification.result_count);
  for (const auto& row : report.verification.rows) {
    logger_.Log(loguru::Verbosity_ERROR, "  [{}] '{}' '{}' '{}'", row.index,
      row.source, row.destination, row.result);
  }
}

void Replicator::AbortAndDrain()
{
  // Setup may fail part way through creating the channels.
  if (!work_ || !results_ || !handoff_) {
    return;
  }
  CancellationController controller(
    { .drain_attempts = config_.drain_attempts }, *work_, *results_,
    *handoff_, worker_units_, receiver_unit_.get(), observer_);
  controller.Abort();
  const auto drain = controller.Drain();
  logger_.Log(loguru::Verbosity_WARNING,
    "pipeline drained: {} workers and {} receiver joined, {} work and {} "
    "result messages discarded in {} passes",
    drain.worker_statuses.size(), drain.receiver_status ? 1 : 0,
    drain.work_messages_drained, drain.result_messages_drained,
    drain.drain_passes);
  if (drain.stranded_collection) {
    logger_.Log(loguru::Verbosity_WARNING,
      "discarded a delivered collection of {} results",
      drain.stranded_collection->paths.size());
  }
}

void Replicator::StopLogAggregator()
{
  if (!aggregator_ || !aggregator_->IsRunning()) {
    return;
  }
  if (const int status = aggregator_->Stop(); status != 0) {
    LOG_F(WARNING, "log aggregator ended with status {}", status);
  }
}

auto Replicator::Run() -> MirrorReport
{
  CHECK_F(!ran_, "a Replicator runs once");
  ran_ = true;

  ValidateConfig();
  ValidatePaths();
  std::error_code ec;
  if (!fs::create_directory(destination_, ec)) {
    throw PathError(destination_,
      fmt::format("cannot create destination '{}': {}", destination_.string(),
        ec ? ec.message() : "already exists"));
  }
  LOG_F(INFO, "mirroring '{}' into '{}'", source_.string(),
    destination_.string());

  MirrorReport report { .source = source_, .destination = destination_ };
  try {
    CreatePipeline();
    StartPipeline();
    PublishTree(report);
    PublishStopMarkers(report);
    JoinWorkers(report);
    const auto collection = CollectResults();
    Evaluate(collection, report);
  } catch (const ipc::OperationCancelled& ex) {
    logger_.Log(loguru::Verbosity_WARNING, "interrupted: {}", ex.what());
    AbortAndDrain();
    StopLogAggregator();
    throw Interrupted(
      fmt::format("mirroring '{}' was interrupted", source_.string()));
  } catch (const std::exception& ex) {
    LOG_F(ERROR, "mirroring '{}' failed: {}", source_.string(), ex.what());
    cancel_.RequestCancel();
    AbortAndDrain();
    StopLogAggregator();
    throw;
  }

  StopLogAggregator();
  if (cancel_.IsCancelRequested()) {
    throw Interrupted(fmt::format(
      "mirroring '{}' was interrupted after completion", source_.string()));
  }
  return report;
}
