#include "sequence_dlq.hpp"

#include <algorithm>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::dlq {

using observability::StringField;
using observability::UintField;

namespace {

DlqSummary ToSummary(const db::model::DlqEntryRecord& r) {
  DlqSummary s;
  s.projection          = r.projection;
  s.stream_id           = r.stream_id;
  s.failed_at_version   = r.failed_at_version;
  s.last_queued_version = r.last_queued_version;
  s.queued_count        = r.last_queued_version >= r.failed_at_version ? r.last_queued_version - r.failed_at_version + 1 : 0;
  s.reason              = r.reason;
  s.enqueued_at_ms      = r.enqueued_at_ms;
  s.updated_at_ms       = r.updated_at_ms;
  s.redrive_attempts    = r.redrive_attempts;
  s.next_redrive_at_ms  = r.next_redrive_at_ms;
  return s;
}

} // namespace

const char* ToString(RedriveOutcome outcome) {
  switch (outcome) {
    case RedriveOutcome::kSucceeded:
      return "succeeded";
    case RedriveOutcome::kPartial:
      return "partial";
    case RedriveOutcome::kCancelled:
      return "cancelled";
    case RedriveOutcome::kNotQuarantined:
      return "not_quarantined";
  }
  return "unknown";
}

SequenceDeadLetterQueue::SequenceDeadLetterQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<journal::EventJournal> journal,
                                                 std::shared_ptr<concurrency::StreamLocks> locks, util::RetryPolicy retry,
                                                 RedriveBackoff backoff)
    : repository_(std::move(repository)), journal_(std::move(journal)), locks_(std::move(locks)), retry_(retry), backoff_(backoff) {
  if (!repository_ || !journal_ || !locks_) {
    throw util::InvalidArgument("dead-letter queue requires a repository, a journal and a lock table");
  }
}

std::size_t SequenceDeadLetterQueue::Hydrate() {
  auto entries = util::WithStorageRetry(retry_, "dlq.hydrate", [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListDlqEntries(*tx);
    tx->Commit();
    return rows;
  });

  quarantined_.Clear();
  for (const auto& entry : entries) {
    quarantined_.Insert(entry.projection, entry.stream_id);
  }
  PublishGauge();

  LEDGER_LOG_INFO("quarantine set hydrated", {UintField("entries", entries.size())});
  return entries.size();
}

void SequenceDeadLetterQueue::Quarantine(const std::string& projection, const std::string& stream_id, uint64_t failed_at_version,
                                         uint64_t last_queued_version, const std::string& reason) {
  if (failed_at_version == 0) {
    throw util::InvalidArgument("quarantine requires a failed version");
  }

  const uint64_t now   = util::NowMillis();
  auto           entry = Load(projection, stream_id);
  if (entry) {
    entry->failed_at_version   = std::min(entry->failed_at_version, failed_at_version);
    entry->last_queued_version = std::max({entry->last_queued_version, last_queued_version, failed_at_version});
    entry->reason              = reason;
    entry->updated_at_ms       = now;
  } else {
    entry.emplace();
    entry->projection          = projection;
    entry->stream_id           = stream_id;
    entry->failed_at_version   = failed_at_version;
    entry->last_queued_version = std::max(last_queued_version, failed_at_version);
    entry->reason              = reason;
    entry->enqueued_at_ms      = now;
    entry->updated_at_ms       = now;
    entry->redrive_attempts    = 0;
    entry->next_redrive_at_ms  = now + static_cast<uint64_t>(BackoffFor(0).count());
  }

  // persisted first: the set never claims a quarantine storage does not know about
  Store(*entry);
  quarantined_.Insert(projection, stream_id);

  observability::Metrics::Instance().RecordQuarantine(projection);
  PublishGauge();
  LEDGER_LOG_WARN("stream quarantined", {StringField("projection", projection), StringField("stream", stream_id),
                                         UintField("failed_at_version", entry->failed_at_version),
                                         UintField("last_queued_version", entry->last_queued_version), StringField("reason", reason)});
}

void SequenceDeadLetterQueue::Enqueue(const std::string& projection, const model::Event& event) {
  auto entry = Load(projection, event.stream_id);
  if (!entry) {
    Quarantine(projection, event.stream_id, event.version, event.version, "queued behind a quarantined stream");
    return;
  }
  if (event.version <= entry->last_queued_version) {
    return;
  }

  entry->last_queued_version = event.version;
  entry->updated_at_ms       = util::NowMillis();
  Store(*entry);
  LEDGER_LOG_DEBUG("event queued behind quarantine",
                   {StringField("projection", projection), StringField("stream", event.stream_id), UintField("version", event.version)});
}

bool SequenceDeadLetterQueue::ExtendTo(const std::string& projection, const std::string& stream_id, uint64_t version) {
  auto entry = Load(projection, stream_id);
  if (!entry) {
    if (quarantined_.Erase(projection, stream_id)) PublishGauge();
    return false;
  }
  if (version > entry->last_queued_version) {
    entry->last_queued_version = version;
    entry->updated_at_ms       = util::NowMillis();
    Store(*entry);
  }
  return true;
}

void SequenceDeadLetterQueue::RewindTo(const std::string& projection, uint64_t version) {
  for (const auto& summary : List()) {
    if (summary.projection != projection || summary.failed_at_version <= version) continue;

    auto entry = Load(projection, summary.stream_id);
    if (!entry) continue;
    entry->failed_at_version = std::max<uint64_t>(version, 1);
    entry->updated_at_ms     = util::NowMillis();
    Store(*entry);
  }
}

std::vector<DlqSummary> SequenceDeadLetterQueue::List() const {
  auto rows = util::WithStorageRetry(retry_, "dlq.list", [&] {
    auto tx      = repository_->Begin();
    auto entries = repository_->ListDlqEntries(*tx);
    tx->Commit();
    return entries;
  });

  std::vector<DlqSummary> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(ToSummary(row));
  }
  return out;
}

std::optional<DlqSummary> SequenceDeadLetterQueue::Get(const std::string& projection, const std::string& stream_id) const {
  auto entry = Load(projection, stream_id);
  if (!entry) return std::nullopt;
  return ToSummary(*entry);
}

std::vector<model::Event> SequenceDeadLetterQueue::QueuedEvents(const std::string& projection, const std::string& stream_id) const {
  auto entry = Load(projection, stream_id);
  if (!entry) return {};
  return journal_->Read(stream_id, entry->failed_at_version, entry->last_queued_version).Collect();
}

std::vector<DlqSummary> SequenceDeadLetterQueue::DueForRedrive(uint64_t now_ms) const {
  std::vector<DlqSummary> due;
  for (auto& summary : List()) {
    if (summary.next_redrive_at_ms <= now_ms) {
      due.push_back(std::move(summary));
    }
  }
  return due;
}

RedriveResult SequenceDeadLetterQueue::Redrive(const std::string& projection, const std::string& stream_id, EventApplier& applier,
                                               const util::CancellationToken* cancel) {
  return observability::ObserveOperation("dlq.redrive", stream_id, [&] {
    RedriveResult result;
    result.projection = projection;
    result.stream_id  = stream_id;

    auto finish = [&](RedriveOutcome outcome, const std::optional<db::model::DlqEntryRecord>& entry) {
      result.outcome = outcome;
      if (entry) {
        result.failed_at_version = entry->failed_at_version;
        result.remaining         = entry->last_queued_version - entry->failed_at_version + 1;
        result.reason            = entry->reason;
      } else {
        result.failed_at_version = 0;
        result.remaining         = 0;
      }
      observability::Metrics::Instance().RecordRedrive(projection, ToString(outcome));
      LEDGER_LOG_INFO("redrive finished", {StringField("projection", projection), StringField("stream", stream_id),
                                           StringField("outcome", ToString(outcome)), UintField("applied", result.applied),
                                           UintField("remaining", result.remaining)});
      return result;
    };

    auto entry = Load(projection, stream_id);
    if (!entry) {
      if (quarantined_.Erase(projection, stream_id)) PublishGauge();
      return finish(RedriveOutcome::kNotQuarantined, std::nullopt);
    }

    const auto key = concurrency::StreamLocks::Key(projection, stream_id);
    for (;;) {
      // The tail can grow while we work; each pass covers what was queued when it started.
      auto cursor        = journal_->Read(stream_id, entry->failed_at_version, entry->last_queued_version);
      bool made_progress = false;

      for (;;) {
        if (cancel && cancel->IsCancelled()) {
          return finish(RedriveOutcome::kCancelled, Load(projection, stream_id));
        }

        auto lock = locks_->Lock(key);
        entry     = Load(projection, stream_id);
        if (!entry) {
          // finished by a concurrent redrive
          if (quarantined_.Erase(projection, stream_id)) PublishGauge();
          return finish(RedriveOutcome::kSucceeded, std::nullopt);
        }

        auto event = cursor.Next();
        if (!event) break;
        if (event->version < entry->failed_at_version) continue;

        try {
          applier.ApplyQueued(projection, *event);
        } catch (const std::exception& e) {
          const uint64_t now        = util::NowMillis();
          entry->failed_at_version  = event->version;
          entry->reason             = e.what();
          entry->redrive_attempts  += 1;
          entry->updated_at_ms      = now;
          entry->next_redrive_at_ms = now + static_cast<uint64_t>(BackoffFor(entry->redrive_attempts).count());
          Store(*entry);
          return finish(RedriveOutcome::kPartial, entry);
        }

        ++result.applied;
        made_progress = true;

        if (event->version >= entry->last_queued_version) {
          Remove(projection, stream_id);
          quarantined_.Erase(projection, stream_id);
          PublishGauge();
          return finish(RedriveOutcome::kSucceeded, std::nullopt);
        }

        entry->failed_at_version = event->version + 1;
        entry->updated_at_ms     = util::NowMillis();
        Store(*entry);
      }

      if (!made_progress) {
        // the queued range is not (or no longer) readable from the journal
        entry->reason        = "queued events missing from journal";
        entry->updated_at_ms = util::NowMillis();
        Store(*entry);
        return finish(RedriveOutcome::kPartial, entry);
      }
    }
  });
}

void SequenceDeadLetterQueue::DiscardProjection(const std::string& projection) {
  util::WithStorageRetry(retry_, "dlq.discard", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->DeleteDlqEntries(*tx, projection), "discard dlq entries");
    tx->Commit();
  });
  quarantined_.EraseProjection(projection);
  PublishGauge();
  LEDGER_LOG_INFO("dlq entries discarded", {StringField("projection", projection)});
}

std::chrono::milliseconds SequenceDeadLetterQueue::BackoffFor(uint32_t attempts) const {
  auto delay = backoff_.initial;
  for (uint32_t i = 0; i < attempts && delay < backoff_.max; ++i) {
    delay *= 2;
  }
  return std::min(delay, backoff_.max);
}

// ------------------------------------------------------------------
// Storage
// ------------------------------------------------------------------

std::optional<db::model::DlqEntryRecord> SequenceDeadLetterQueue::Load(const std::string& projection, const std::string& stream_id) const {
  return util::WithStorageRetry(retry_, "dlq.load", [&] {
    auto tx    = repository_->Begin();
    auto entry = repository_->GetDlqEntry(*tx, projection, stream_id);
    tx->Commit();
    return entry;
  });
}

void SequenceDeadLetterQueue::Store(const db::model::DlqEntryRecord& entry) {
  util::WithStorageRetry(retry_, "dlq.store", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->UpsertDlqEntry(*tx, entry), "store dlq entry");
    tx->Commit();
  });
}

void SequenceDeadLetterQueue::Remove(const std::string& projection, const std::string& stream_id) {
  util::WithStorageRetry(retry_, "dlq.remove", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->DeleteDlqEntry(*tx, projection, stream_id), "remove dlq entry");
    tx->Commit();
  });
}

void SequenceDeadLetterQueue::PublishGauge() const {
  observability::Metrics::Instance().SetQuarantinedStreams(quarantined_.Size());
}

} // namespace ledger::dlq
