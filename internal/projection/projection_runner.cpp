#include "projection_runner.hpp"

#include <chrono>
#include <exception>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::projection {

using observability::StringField;
using observability::UintField;

const char* ToString(ConsumeOutcome outcome) {
  switch (outcome) {
    case ConsumeOutcome::kApplied:
      return "applied";
    case ConsumeOutcome::kDuplicate:
      return "duplicate";
    case ConsumeOutcome::kQueued:
      return "queued";
    case ConsumeOutcome::kQuarantined:
      return "quarantined";
  }
  return "unknown";
}

ProjectionRunner::ProjectionRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<journal::EventJournal> journal,
                                   std::shared_ptr<dlq::SequenceDeadLetterQueue> dlq, std::shared_ptr<concurrency::StreamLocks> locks,
                                   RunnerOptions options)
    : repository_(std::move(repository)),
      journal_(std::move(journal)),
      dlq_(std::move(dlq)),
      locks_(std::move(locks)),
      options_(std::move(options)) {
  if (!repository_ || !journal_ || !dlq_ || !locks_) {
    throw util::InvalidArgument("projection runner requires a repository, a journal, a dead-letter queue and a lock table");
  }
}

// ---------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------

void ProjectionRunner::RegisterProjection(const std::string& name, ApplyFn apply) {
  if (name.empty()) {
    throw util::InvalidArgument("projection name is required");
  }
  if (!apply) {
    throw util::InvalidArgument("projection " + name + " needs an apply function");
  }

  std::unique_lock lock(registry_mutex_);
  if (!projections_.emplace(name, std::move(apply)).second) {
    throw util::AlreadyExists("projection " + name + " is already registered");
  }
  LEDGER_LOG_INFO("projection registered", {StringField("projection", name)});
}

bool ProjectionRunner::HasProjection(const std::string& name) const {
  std::shared_lock lock(registry_mutex_);
  return projections_.contains(name);
}

std::vector<std::string> ProjectionRunner::Projections() const {
  std::shared_lock         lock(registry_mutex_);
  std::vector<std::string> names;
  names.reserve(projections_.size());
  for (const auto& [name, _] : projections_) {
    names.push_back(name);
  }
  return names;
}

ProjectionRunner::ApplyFn ProjectionRunner::Lookup(const std::string& projection) const {
  std::shared_lock lock(registry_mutex_);
  auto             it = projections_.find(projection);
  if (it == projections_.end()) {
    throw util::NotFound("projection " + projection + " is not registered");
  }
  return it->second;
}

// ---------------------------------------------------------------------
// Push path
// ---------------------------------------------------------------------

void ProjectionRunner::Consume(const model::Event& event) {
  std::shared_lock replay(replay_mutex_);

  std::exception_ptr first_error;
  for (const auto& name : Projections()) {
    try {
      ConsumeLocked(name, Lookup(name), event);
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("projection dispatch failed", {StringField("projection", name), StringField("stream", event.stream_id),
                                                      UintField("version", event.version), StringField("error", e.what())});
      if (!first_error) first_error = std::current_exception();
    }
  }
  if (first_error) std::rethrow_exception(first_error);
}

void ProjectionRunner::Consume(const journal::AppendResult& appended) {
  for (const auto& event : appended.events) {
    Consume(event);
  }
}

ConsumeOutcome ProjectionRunner::ConsumeFor(const std::string& projection, const model::Event& event) {
  std::shared_lock replay(replay_mutex_);
  return ConsumeLocked(projection, Lookup(projection), event);
}

ConsumeOutcome ProjectionRunner::ConsumeLocked(const std::string& projection, const ApplyFn& apply, const model::Event& event) {
  auto lock = locks_->Lock(concurrency::StreamLocks::Key(projection, event.stream_id));

  if (dlq_->Quarantined().Contains(projection, event.stream_id)) {
    dlq_->Enqueue(projection, event);
    return ConsumeOutcome::kQueued;
  }

  const uint64_t checkpoint = Checkpoint(projection, event.stream_id);
  if (event.version <= checkpoint) {
    return ConsumeOutcome::kDuplicate;
  }

  uint64_t expected = checkpoint + 1;
  if (event.version > expected) {
    auto cursor = journal_->Read(event.stream_id, expected, event.version - 1);
    while (auto missing = cursor.Next()) {
      if (missing->version != expected) break;
      if (!TryApply(projection, apply, *missing, event.version)) {
        return ConsumeOutcome::kQuarantined;
      }
      ++expected;
    }
    if (expected != event.version) {
      dlq_->Quarantine(projection, event.stream_id, expected, event.version,
                       "version " + std::to_string(expected) + " missing from journal");
      return ConsumeOutcome::kQuarantined;
    }
  }

  if (!TryApply(projection, apply, event, event.version)) {
    return ConsumeOutcome::kQuarantined;
  }
  return ConsumeOutcome::kApplied;
}

bool ProjectionRunner::TryApply(const std::string& projection, const ApplyFn& apply, const model::Event& event, uint64_t last_queued) {
  try {
    ApplyOne(projection, apply, event);
    return true;
  } catch (const std::exception& e) {
    LEDGER_LOG_WARN("projection apply failed", {StringField("projection", projection), StringField("stream", event.stream_id),
                                                UintField("version", event.version), StringField("type", event.type),
                                                StringField("error", e.what())});
    dlq_->Quarantine(projection, event.stream_id, event.version, last_queued, e.what());
    return false;
  }
}

void ProjectionRunner::ApplyOne(const std::string& projection, const ApplyFn& apply, const model::Event& event) {
  observability::SpanScope span("projection.apply");
  span.SetAttribute("projection", projection);
  span.SetAttribute("stream.id", event.stream_id);
  span.SetAttribute("event.version", static_cast<std::int64_t>(event.version));

  const auto started_at = std::chrono::steady_clock::now();
  util::WithStorageRetry(options_.storage_retry, "projection.apply", [&] {
    auto            tx = repository_->Begin();
    ReadModelWriter writer(*repository_, *tx, projection, event.version);
    apply(writer, event);

    db::model::CheckpointRecord checkpoint;
    checkpoint.projection           = projection;
    checkpoint.stream_id            = event.stream_id;
    checkpoint.last_applied_version = event.version;
    checkpoint.updated_at_ms        = util::NowMillis();
    db::ThrowIfError(repository_->UpsertCheckpoint(*tx, checkpoint), "checkpoint " + projection);

    tx->Commit();
  });

  observability::Metrics::Instance().ObserveApplyLatencyMs(
      projection, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

// ---------------------------------------------------------------------
// Pull path
// ---------------------------------------------------------------------

uint64_t ProjectionRunner::CatchUp(const std::string& projection) {
  std::shared_lock replay(replay_mutex_);
  return CatchUpLocked(projection);
}

uint64_t ProjectionRunner::CatchUpAll() {
  std::shared_lock replay(replay_mutex_);

  uint64_t           applied = 0;
  std::exception_ptr first_error;
  for (const auto& name : Projections()) {
    try {
      applied += CatchUpLocked(name);
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("projection catch-up failed", {StringField("projection", name), StringField("error", e.what())});
      if (!first_error) first_error = std::current_exception();
    }
  }
  if (first_error) std::rethrow_exception(first_error);
  return applied;
}

uint64_t ProjectionRunner::CatchUpLocked(const std::string& projection) {
  const ApplyFn apply = Lookup(projection);

  uint64_t applied = 0;
  for (const auto& stream : journal_->ListStreams()) {
    applied += CatchUpStream(projection, apply, stream.stream_id, stream.version);
  }
  if (applied > 0) {
    LEDGER_LOG_INFO("projection caught up", {StringField("projection", projection), UintField("applied", applied)});
  }
  return applied;
}

uint64_t ProjectionRunner::CatchUpStream(const std::string& projection, const ApplyFn& apply, const std::string& stream_id, uint64_t head) {
  auto lock = locks_->Lock(concurrency::StreamLocks::Key(projection, stream_id));

  if (dlq_->Quarantined().Contains(projection, stream_id) && dlq_->ExtendTo(projection, stream_id, head)) {
    return 0;
  }

  const uint64_t checkpoint = Checkpoint(projection, stream_id);
  if (checkpoint >= head) {
    return 0;
  }

  uint64_t applied = 0;
  auto     cursor  = journal_->Read(stream_id, checkpoint + 1, head);
  while (auto event = cursor.Next()) {
    if (!TryApply(projection, apply, *event, head)) break;
    ++applied;
  }
  return applied;
}

uint64_t ProjectionRunner::Replay(const std::string& projection, uint64_t from_version) {
  return observability::ObserveOperation("projection.replay", "", [&] {
    std::unique_lock replay(replay_mutex_);
    Lookup(projection);

    if (from_version == 0) {
      dlq_->DiscardProjection(projection);
      util::WithStorageRetry(options_.storage_retry, "projection.reset", [&] {
        auto tx = repository_->Begin();
        db::ThrowIfError(repository_->DeleteReadModels(*tx, projection), "drop read models " + projection);
        db::ThrowIfError(repository_->DeleteCheckpoints(*tx, projection), "drop checkpoints " + projection);
        tx->Commit();
      });
    } else {
      util::WithStorageRetry(options_.storage_retry, "projection.rewind", [&] {
        auto tx = repository_->Begin();
        for (auto checkpoint : repository_->ListCheckpoints(*tx, projection)) {
          if (checkpoint.last_applied_version < from_version) continue;
          checkpoint.last_applied_version = from_version - 1;
          checkpoint.updated_at_ms        = util::NowMillis();
          db::ThrowIfError(repository_->UpsertCheckpoint(*tx, checkpoint), "rewind checkpoint " + projection);
        }
        tx->Commit();
      });
      dlq_->RewindTo(projection, from_version);
    }

    LEDGER_LOG_INFO("projection replay started", {StringField("projection", projection), UintField("from_version", from_version)});
    return CatchUpLocked(projection);
  });
}

// ---------------------------------------------------------------------
// Blue-green
// ---------------------------------------------------------------------

bool ProjectionRunner::IsCaughtUp(const std::string& projection) const {
  Lookup(projection);
  if (dlq_->Quarantined().CountFor(projection) > 0) {
    return false;
  }

  auto checkpoints = util::WithStorageRetry(options_.storage_retry, "projection.checkpoints", [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListCheckpoints(*tx, projection);
    tx->Commit();
    return rows;
  });

  std::unordered_map<std::string, uint64_t> applied;
  for (const auto& row : checkpoints) {
    applied[row.stream_id] = row.last_applied_version;
  }

  for (const auto& stream : journal_->ListStreams()) {
    auto it = applied.find(stream.stream_id);
    if (stream.version > 0 && (it == applied.end() || it->second < stream.version)) {
      return false;
    }
  }
  return true;
}

void ProjectionRunner::Cutover(const std::string& alias, const std::string& projection) {
  if (alias.empty()) {
    throw util::InvalidArgument("alias is required");
  }
  if (!IsCaughtUp(projection)) {
    throw util::InvalidState("projection " + projection + " is not caught up; cutover refused");
  }

  util::WithStorageRetry(options_.storage_retry, "projection.cutover", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->UpsertProjectionAlias(*tx, alias, projection), "cutover " + alias);
    tx->Commit();
  });
  LEDGER_LOG_INFO("alias cut over", {StringField("alias", alias), StringField("projection", projection)});
}

std::optional<std::string> ProjectionRunner::ResolveAlias(const std::string& alias) const {
  return util::WithStorageRetry(options_.storage_retry, "projection.alias", [&] {
    auto tx     = repository_->Begin();
    auto target = repository_->GetProjectionAlias(*tx, alias);
    tx->Commit();
    return target;
  });
}

// ---------------------------------------------------------------------
// Redrive
// ---------------------------------------------------------------------

dlq::RedriveResult ProjectionRunner::Redrive(const std::string& projection, const std::string& stream_id,
                                             const util::CancellationToken* cancel) {
  std::shared_lock replay(replay_mutex_);
  Lookup(projection);
  return dlq_->Redrive(projection, stream_id, *this, cancel);
}

std::vector<dlq::RedriveResult> ProjectionRunner::RedriveStream(const std::string& stream_id, const util::CancellationToken* cancel) {
  std::vector<dlq::RedriveResult> results;
  for (const auto& name : Projections()) {
    if (!dlq_->Quarantined().Contains(name, stream_id)) continue;
    results.push_back(Redrive(name, stream_id, cancel));
  }
  return results;
}

void ProjectionRunner::ApplyQueued(const std::string& projection, const model::Event& event) {
  const ApplyFn  apply      = Lookup(projection);
  const uint64_t checkpoint = Checkpoint(projection, event.stream_id);
  if (event.version <= checkpoint) {
    return;
  }

  // after a partial replay the checkpoint can sit below the queued range
  if (event.version > checkpoint + 1) {
    auto cursor = journal_->Read(event.stream_id, checkpoint + 1, event.version - 1);
    while (auto missing = cursor.Next()) {
      ApplyOne(projection, apply, *missing);
    }
  }
  ApplyOne(projection, apply, event);
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

uint64_t ProjectionRunner::Checkpoint(const std::string& projection, const std::string& stream_id) const {
  return util::WithStorageRetry(options_.storage_retry, "projection.checkpoint", [&] {
    auto tx         = repository_->Begin();
    auto checkpoint = repository_->GetCheckpoint(*tx, projection, stream_id);
    tx->Commit();
    return checkpoint ? checkpoint->last_applied_version : uint64_t{0};
  });
}

std::optional<std::string> ProjectionRunner::ReadModel(const std::string& projection, const std::string& key) const {
  return util::WithStorageRetry(options_.storage_retry, "projection.read_model", [&] {
    auto tx  = repository_->Begin();
    auto row = repository_->GetReadModel(*tx, projection, key);
    tx->Commit();
    return row ? std::optional<std::string>(std::move(row->value)) : std::nullopt;
  });
}

} // namespace ledger::projection
