#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/aggregate/aggregate.hpp"
#include "internal/aggregate/rehydrator.hpp"
#include "internal/concurrency/concurrency_controller.hpp"
#include "internal/concurrency/stream_locks.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dlq/sequence_dlq.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/projection/projection_runner.hpp"
#include "internal/snapshot/snapshot_store.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/retry.hpp"

namespace ledger::core {

struct EventStoreOptions {
  journal::JournalOptions          journal;
  snapshot::SnapshotPolicy         snapshots;
  bool                             snapshot_on_rehydrate = true;
  concurrency::ConcurrencyOptions  concurrency;
  projection::RunnerOptions        projections;
  dlq::RedriveBackoff              redrive_backoff;
  util::RetryPolicy                storage_retry;
  // push appended events to the projection runner after commit
  bool dispatch_on_append = true;
};

/*
  Entry point for collaborators: command handlers append and
  rehydrate, projection owners register and replay, operators inspect
  and redrive the dead-letter queue.

  Owns one instance of every component, all over the same repository.
*/
class EventStore {
 public:
  explicit EventStore(std::shared_ptr<db::Repository> repository, EventStoreOptions options = {});
  ~EventStore();

  EventStore(const EventStore&)            = delete;
  EventStore& operator=(const EventStore&) = delete;

  // ---------------------------------------------------------------------
  // Journal
  // ---------------------------------------------------------------------

  journal::AppendResult Append(const std::string& stream_id, uint64_t expected_version, std::vector<model::NewEvent> events);

  journal::EventCursor Read(const std::string& stream_id, uint64_t from_version = 1,
                            std::optional<uint64_t> to_version = std::nullopt) const;

  uint64_t StreamVersion(const std::string& stream_id) const;

  std::optional<db::model::SnapshotRecord> Snapshot(const std::string& stream_id) const;

  void ShredPayload(const std::string& event_id);

  // ---------------------------------------------------------------------
  // Projections
  // ---------------------------------------------------------------------

  void     RegisterProjection(const std::string& name, projection::ProjectionRunner::ApplyFn apply);
  uint64_t Replay(const std::string& projection, uint64_t from_version = 0);
  void     Cutover(const std::string& alias, const std::string& projection);

  std::optional<std::string> ResolveAlias(const std::string& alias) const;

  // ---------------------------------------------------------------------
  // Dead-letter queue
  // ---------------------------------------------------------------------

  std::vector<dlq::DlqSummary> ListDLQ() const;

  dlq::RedriveResult Redrive(const std::string& projection, const std::string& stream_id,
                             const util::CancellationToken* cancel = nullptr);

  // Every projection quarantined on the stream.
  std::vector<dlq::RedriveResult> Redrive(const std::string& stream_id, const util::CancellationToken* cancel = nullptr);

  // Rebuilds the quarantine set and catches every projection up.
  void Start();

  // ---------------------------------------------------------------------
  // Aggregates
  // ---------------------------------------------------------------------

  template <typename State>
  std::shared_ptr<aggregate::Rehydrator<State>> MakeRehydrator(std::shared_ptr<const aggregate::AggregateDefinition<State>> definition) const {
    return std::make_shared<aggregate::Rehydrator<State>>(journal_, snapshots_, std::move(definition), options_.snapshot_on_rehydrate);
  }

  template <typename State>
  std::shared_ptr<concurrency::ConcurrencyController<State>> MakeController(
      std::shared_ptr<const aggregate::AggregateDefinition<State>> definition) const {
    return std::make_shared<concurrency::ConcurrencyController<State>>(journal_, MakeRehydrator<State>(std::move(definition)),
                                                                       options_.concurrency, command_locks_);
  }

  const std::shared_ptr<db::Repository>& Repository() const {
    return repository_;
  }
  const std::shared_ptr<journal::EventJournal>& Journal() const {
    return journal_;
  }
  const std::shared_ptr<snapshot::SnapshotStore>& Snapshots() const {
    return snapshots_;
  }
  const std::shared_ptr<projection::ProjectionRunner>& Projections() const {
    return runner_;
  }
  const std::shared_ptr<dlq::SequenceDeadLetterQueue>& DeadLetters() const {
    return dlq_;
  }

 private:
  EventStoreOptions options_;

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<journal::EventJournal>        journal_;
  std::shared_ptr<snapshot::SnapshotStore>      snapshots_;
  std::shared_ptr<concurrency::StreamLocks>     projection_locks_;
  std::shared_ptr<concurrency::StreamLocks>     command_locks_;
  std::shared_ptr<dlq::SequenceDeadLetterQueue> dlq_;
  std::shared_ptr<projection::ProjectionRunner> runner_;
};

} // namespace ledger::core
