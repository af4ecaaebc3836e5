#include "event_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

using observability::UintField;

EventStore::EventStore(std::shared_ptr<db::Repository> repository, EventStoreOptions options)
    : options_(std::move(options)), repository_(std::move(repository)) {
  if (!repository_) {
    throw util::InvalidArgument("event store requires a repository");
  }

  journal_          = std::make_shared<journal::EventJournal>(repository_, options_.journal);
  snapshots_        = std::make_shared<snapshot::SnapshotStore>(repository_, options_.snapshots, options_.storage_retry);
  projection_locks_ = std::make_shared<concurrency::StreamLocks>();
  command_locks_    = std::make_shared<concurrency::StreamLocks>();
  dlq_ = std::make_shared<dlq::SequenceDeadLetterQueue>(repository_, journal_, projection_locks_, options_.storage_retry,
                                                        options_.redrive_backoff);
  runner_ = std::make_shared<projection::ProjectionRunner>(repository_, journal_, dlq_, projection_locks_, options_.projections);

  if (options_.dispatch_on_append) {
    // the journal must not keep the runner alive
    std::weak_ptr<projection::ProjectionRunner> weak_runner = runner_;
    journal_->SetAppendObserver([weak_runner](const journal::AppendResult& appended) {
      if (auto runner = weak_runner.lock()) {
        runner->Consume(appended);
      }
    });
  }
}

EventStore::~EventStore() {
  journal_->SetAppendObserver(nullptr);
}

void EventStore::Start() {
  const auto quarantined = dlq_->Hydrate();
  const auto applied     = runner_->CatchUpAll();
  LEDGER_LOG_INFO("event store started", {UintField("quarantined", quarantined), UintField("caught_up_events", applied)});
}

// ---------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------

journal::AppendResult EventStore::Append(const std::string& stream_id, uint64_t expected_version, std::vector<model::NewEvent> events) {
  return journal_->Append(stream_id, expected_version, std::move(events));
}

journal::EventCursor EventStore::Read(const std::string& stream_id, uint64_t from_version, std::optional<uint64_t> to_version) const {
  return journal_->Read(stream_id, from_version, to_version);
}

uint64_t EventStore::StreamVersion(const std::string& stream_id) const {
  return journal_->StreamVersion(stream_id);
}

std::optional<db::model::SnapshotRecord> EventStore::Snapshot(const std::string& stream_id) const {
  return snapshots_->LoadLatest(stream_id);
}

void EventStore::ShredPayload(const std::string& event_id) {
  journal_->ShredPayload(event_id);
}

// ---------------------------------------------------------------------
// Projections
// ---------------------------------------------------------------------

void EventStore::RegisterProjection(const std::string& name, projection::ProjectionRunner::ApplyFn apply) {
  runner_->RegisterProjection(name, std::move(apply));
}

uint64_t EventStore::Replay(const std::string& projection, uint64_t from_version) {
  return runner_->Replay(projection, from_version);
}

void EventStore::Cutover(const std::string& alias, const std::string& projection) {
  runner_->Cutover(alias, projection);
}

std::optional<std::string> EventStore::ResolveAlias(const std::string& alias) const {
  return runner_->ResolveAlias(alias);
}

// ---------------------------------------------------------------------
// Dead-letter queue
// ---------------------------------------------------------------------

std::vector<dlq::DlqSummary> EventStore::ListDLQ() const {
  return dlq_->List();
}

dlq::RedriveResult EventStore::Redrive(const std::string& projection, const std::string& stream_id, const util::CancellationToken* cancel) {
  return runner_->Redrive(projection, stream_id, cancel);
}

std::vector<dlq::RedriveResult> EventStore::Redrive(const std::string& stream_id, const util::CancellationToken* cancel) {
  return runner_->RedriveStream(stream_id, cancel);
}

} // namespace ledger::core
