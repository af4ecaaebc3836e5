#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/concurrency/stream_locks.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dlq/event_applier.hpp"
#include "internal/dlq/sequence_dlq.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/projection/read_model_writer.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/retry.hpp"

namespace ledger::projection {

enum class ConsumeOutcome {
  kApplied,
  kDuplicate,
  kQueued,
  kQuarantined,
};

struct RunnerOptions {
  util::RetryPolicy storage_retry;
};

/*
  Applies journal events to named projections.

  Per (projection, stream) the runner keeps a checkpoint: the version
  of the last event whose read-model change committed. The change and
  the checkpoint share one transaction, so a redelivered event at or
  below the checkpoint is a no-op and a crash never half-applies.

  Events arrive pushed (Consume, wired to the journal's append
  observer) or pulled (CatchUp). Gaps in pushed delivery are filled
  from the journal before the delivered event. A failing apply
  quarantines the stream for that projection in the sequence DLQ;
  later events of that stream queue there until redriven.

  Apply functions must be deterministic and idempotent per event
  (upsert-style), since partial replay re-applies over existing rows.
*/
class ProjectionRunner final : public dlq::EventApplier {
 public:
  using ApplyFn = std::function<void(ReadModelWriter&, const model::Event&)>;

  ProjectionRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<journal::EventJournal> journal,
                   std::shared_ptr<dlq::SequenceDeadLetterQueue> dlq, std::shared_ptr<concurrency::StreamLocks> locks,
                   RunnerOptions options = {});

  // Throws InvalidArgument on an empty name or function, AlreadyExists on a duplicate.
  void                     RegisterProjection(const std::string& name, ApplyFn apply);
  bool                     HasProjection(const std::string& name) const;
  std::vector<std::string> Projections() const;

  // Delivers to every registered projection. Each projection is tried even
  // when an earlier one fails; the first failure is rethrown afterwards.
  void Consume(const model::Event& event);
  void Consume(const journal::AppendResult& appended);

  ConsumeOutcome ConsumeFor(const std::string& projection, const model::Event& event);

  // Pull every stream from its checkpoint to the head. Returns events applied.
  uint64_t CatchUp(const std::string& projection);
  uint64_t CatchUpAll();

  // from_version 0 rebuilds from nothing; otherwise checkpoints at or
  // above from_version drop to from_version - 1 before catching up.
  uint64_t Replay(const std::string& projection, uint64_t from_version = 0);

  bool                       IsCaughtUp(const std::string& projection) const;
  void                       Cutover(const std::string& alias, const std::string& projection);
  std::optional<std::string> ResolveAlias(const std::string& alias) const;

  dlq::RedriveResult              Redrive(const std::string& projection, const std::string& stream_id,
                                          const util::CancellationToken* cancel = nullptr);
  std::vector<dlq::RedriveResult> RedriveStream(const std::string& stream_id, const util::CancellationToken* cancel = nullptr);

  uint64_t                   Checkpoint(const std::string& projection, const std::string& stream_id) const;
  std::optional<std::string> ReadModel(const std::string& projection, const std::string& key) const;

  void ApplyQueued(const std::string& projection, const model::Event& event) override;

 private:
  ApplyFn        Lookup(const std::string& projection) const;
  ConsumeOutcome ConsumeLocked(const std::string& projection, const ApplyFn& apply, const model::Event& event);
  uint64_t       CatchUpLocked(const std::string& projection);
  uint64_t       CatchUpStream(const std::string& projection, const ApplyFn& apply, const std::string& stream_id, uint64_t head);
  bool           TryApply(const std::string& projection, const ApplyFn& apply, const model::Event& event, uint64_t last_queued);
  void           ApplyOne(const std::string& projection, const ApplyFn& apply, const model::Event& event);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<journal::EventJournal>        journal_;
  std::shared_ptr<dlq::SequenceDeadLetterQueue> dlq_;
  std::shared_ptr<concurrency::StreamLocks>     locks_;
  RunnerOptions                                 options_;

  mutable std::shared_mutex      registry_mutex_;
  std::map<std::string, ApplyFn> projections_;

  // Lock order: replay_mutex_ before any StreamLocks shard.
  // Consumption, catch-up and redrive hold it shared; Replay exclusive.
  std::shared_mutex replay_mutex_;
};

const char* ToString(ConsumeOutcome outcome);

} // namespace ledger::projection
