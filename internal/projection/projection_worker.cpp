#include "projection_worker.hpp"

#include <exception>

#include "internal/dlq/sequence_dlq.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/projection_runner.hpp"
#include "internal/util/time.hpp"

namespace ledger::projection {

using observability::StringField;
using observability::UintField;

ProjectionWorker::ProjectionWorker(std::shared_ptr<ProjectionRunner> runner, std::shared_ptr<dlq::SequenceDeadLetterQueue> dlq,
                                   WorkerOptions options)
    : runner_(std::move(runner)), dlq_(std::move(dlq)), options_(options) {
}

ProjectionWorker::~ProjectionWorker() {
  Stop();
}

void ProjectionWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ProjectionWorker::Run, this);
  LEDGER_LOG_INFO("projection worker started", {UintField("poll_interval_ms", static_cast<uint64_t>(options_.poll_interval.count()))});
}

void ProjectionWorker::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    LEDGER_LOG_INFO("projection worker stopped");
  }
}

void ProjectionWorker::Run() {
  while (running_) {
    RunOnce();

    std::unique_lock lock(wake_mutex_);
    wake_.wait_for(lock, options_.poll_interval, [this] { return !running_; });
  }
}

void ProjectionWorker::RunOnce() {
  try {
    runner_->CatchUpAll();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("projection catch-up tick failed", {StringField("error", e.what())});
  }

  if (!options_.auto_redrive) return;

  for (const auto& entry : dlq_->DueForRedrive(util::NowMillis())) {
    if (!runner_->HasProjection(entry.projection)) continue;
    try {
      auto result = runner_->Redrive(entry.projection, entry.stream_id);
      LEDGER_LOG_INFO("automatic redrive finished",
                      {StringField("projection", entry.projection), StringField("stream", entry.stream_id),
                       StringField("outcome", dlq::ToString(result.outcome)), UintField("applied", result.applied)});
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("automatic redrive failed",
                       {StringField("projection", entry.projection), StringField("stream", entry.stream_id), StringField("error", e.what())});
    }
  }
}

} // namespace ledger::projection
