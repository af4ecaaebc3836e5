#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/concurrency/stream_locks.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dlq/event_applier.hpp"
#include "internal/dlq/quarantine_set.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/retry.hpp"

namespace ledger::dlq {

enum class RedriveOutcome {
  kSucceeded,
  kPartial,
  kCancelled,
  kNotQuarantined,
};

const char* ToString(RedriveOutcome outcome);

struct RedriveResult {
  RedriveOutcome outcome = RedriveOutcome::kNotQuarantined;
  std::string    projection;
  std::string    stream_id;
  uint64_t       applied = 0;
  // first version still queued; 0 once the stream is flowing again
  uint64_t    failed_at_version = 0;
  uint64_t    remaining         = 0;
  std::string reason;
};

struct DlqSummary {
  std::string projection;
  std::string stream_id;
  uint64_t    failed_at_version   = 0;
  uint64_t    last_queued_version = 0;
  uint64_t    queued_count        = 0;
  std::string reason;
  uint64_t    enqueued_at_ms     = 0;
  uint64_t    updated_at_ms      = 0;
  uint32_t    redrive_attempts   = 0;
  uint64_t    next_redrive_at_ms = 0;
};

struct RedriveBackoff {
  std::chrono::milliseconds initial = std::chrono::seconds(1);
  std::chrono::milliseconds max     = std::chrono::minutes(5);
};

/*
  Sequence dead-letter queue.

  When a projection fails on event k of a stream, that stream is
  quarantined for that projection: k and every later event of the
  stream are queued here instead of being applied, so the read model
  never sees them out of order. Other streams, and other projections
  of the same stream, keep flowing.

  An entry stores the contiguous range [failed_at_version,
  last_queued_version]; the events themselves are read back from the
  journal, which never changes them.

  Quarantine/Enqueue/ExtendTo expect the caller to hold the
  (projection, stream) lock from the shared StreamLocks. Redrive takes
  it itself, one event at a time.
*/
class SequenceDeadLetterQueue {
 public:
  SequenceDeadLetterQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<journal::EventJournal> journal,
                          std::shared_ptr<concurrency::StreamLocks> locks, util::RetryPolicy retry = {}, RedriveBackoff backoff = {});

  QuarantineSet& Quarantined() {
    return quarantined_;
  }
  const QuarantineSet& Quarantined() const {
    return quarantined_;
  }

  // Rebuilds the quarantine set from storage. Returns the entry count.
  std::size_t Hydrate();

  // FLOWING -> QUARANTINED, or widens an existing entry.
  void Quarantine(const std::string& projection, const std::string& stream_id, uint64_t failed_at_version, uint64_t last_queued_version,
                  const std::string& reason);

  // Queues an event behind an open entry; already-queued versions are a no-op.
  void Enqueue(const std::string& projection, const model::Event& event);

  // Extends the queued tail to `version` (catch-up on a quarantined stream).
  // Returns false when no entry exists, after dropping the stale set key.
  bool ExtendTo(const std::string& projection, const std::string& stream_id, uint64_t version);

  // Lowers failed_at_version to `version` on every entry above it (partial replay).
  void RewindTo(const std::string& projection, uint64_t version);

  std::vector<DlqSummary>   List() const;
  std::optional<DlqSummary> Get(const std::string& projection, const std::string& stream_id) const;
  std::vector<model::Event> QueuedEvents(const std::string& projection, const std::string& stream_id) const;

  // Entries whose next_redrive_at_ms has passed.
  std::vector<DlqSummary> DueForRedrive(uint64_t now_ms) const;

  RedriveResult Redrive(const std::string& projection, const std::string& stream_id, EventApplier& applier,
                        const util::CancellationToken* cancel = nullptr);

  // Drops every entry of a projection (full rebuild).
  void DiscardProjection(const std::string& projection);

  std::chrono::milliseconds BackoffFor(uint32_t attempts) const;

 private:
  std::optional<db::model::DlqEntryRecord> Load(const std::string& projection, const std::string& stream_id) const;
  void                                     Store(const db::model::DlqEntryRecord& entry);
  void                                     Remove(const std::string& projection, const std::string& stream_id);
  void                                     PublishGauge() const;

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<journal::EventJournal>    journal_;
  std::shared_ptr<concurrency::StreamLocks> locks_;
  util::RetryPolicy                         retry_;
  RedriveBackoff                            backoff_;
  QuarantineSet                             quarantined_;
};

} // namespace ledger::dlq
