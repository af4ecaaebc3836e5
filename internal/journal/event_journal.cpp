#include "event_journal.hpp"

#include <algorithm>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ledger::journal {

using observability::StringField;
using observability::UintField;

EventJournal::EventJournal(std::shared_ptr<db::Repository> repository, JournalOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  if (!repository_) {
    throw util::InvalidArgument("event journal requires a repository");
  }
  if (options_.read_batch_size == 0) {
    options_.read_batch_size = 256;
  }
}

AppendResult EventJournal::Append(const std::string& stream_id, uint64_t expected_version, std::vector<model::NewEvent> events) {
  return observability::ObserveOperation("journal.append", stream_id, [&] {
    if (stream_id.empty()) {
      throw util::InvalidArgument("append: stream id is required");
    }
    if (events.empty()) {
      throw util::InvalidArgument("append: at least one event is required");
    }

    const uint64_t                  now = util::NowMillis();
    std::vector<db::model::EventRecord> records;
    records.reserve(events.size());
    for (auto& e : events) {
      if (e.type.empty()) {
        throw util::InvalidArgument("append: event type is required");
      }
      db::model::EventRecord r;
      r.event_id       = e.event_id.empty() ? util::NewUUIDString() : std::move(e.event_id);
      r.type           = std::move(e.type);
      r.payload        = std::move(e.payload);
      r.correlation_id = std::move(e.correlation_id);
      r.causation_id   = std::move(e.causation_id);
      r.occurred_at_ms = e.occurred_at_ms == 0 ? now : e.occurred_at_ms;
      records.push_back(std::move(r));
    }

    AppendResult result = util::WithStorageRetry(options_.storage_retry, "journal.append", [&] {
      auto batch = records;
      auto tx    = repository_->Begin();

      auto r = repository_->AppendEvents(*tx, stream_id, expected_version, batch);
      if (r.code == db::ErrorCode::Conflict) {
        auto     stream = repository_->GetStream(*tx, stream_id);
        uint64_t actual = stream ? stream->version : 0;
        if (actual == expected_version) {
          // lost a creation race; the stream moved underneath us
          throw util::StorageFailure("append: " + r.message);
        }
        throw util::VersionConflict(stream_id, expected_version, actual);
      }
      db::ThrowIfError(r, "append");
      tx->Commit();

      AppendResult out;
      out.stream_id         = stream_id;
      out.first_version     = expected_version + 1;
      out.committed_version = expected_version + batch.size();
      out.events            = std::move(batch);
      return out;
    });

    LEDGER_LOG_DEBUG("events appended", {StringField("stream", stream_id), UintField("first_version", result.first_version),
                                         UintField("committed_version", result.committed_version)});

    NotifyObserver(result);
    return result;
  });
}

EventCursor EventJournal::Read(const std::string& stream_id, uint64_t from_version, std::optional<uint64_t> to_version) const {
  uint64_t head = StreamVersion(stream_id);
  uint64_t end  = to_version ? std::min(*to_version, head) : head;
  return EventCursor(*this, stream_id, from_version, end);
}

uint64_t EventJournal::StreamVersion(const std::string& stream_id) const {
  return util::WithStorageRetry(options_.storage_retry, "journal.stream_version", [&] {
    auto tx     = repository_->Begin();
    auto stream = repository_->GetStream(*tx, stream_id);
    tx->Commit();
    return stream ? stream->version : uint64_t{0};
  });
}

std::vector<db::model::StreamRecord> EventJournal::ListStreams() const {
  return util::WithStorageRetry(options_.storage_retry, "journal.list_streams", [&] {
    auto tx      = repository_->Begin();
    auto streams = repository_->ListStreams(*tx);
    tx->Commit();
    return streams;
  });
}

std::optional<model::Event> EventJournal::FindEvent(const std::string& event_id) const {
  return util::WithStorageRetry(options_.storage_retry, "journal.find_event", [&] {
    auto tx    = repository_->Begin();
    auto event = repository_->GetEventById(*tx, event_id);
    tx->Commit();
    return event;
  });
}

void EventJournal::ShredPayload(const std::string& event_id) {
  observability::ObserveOperation("journal.shred", "", [&] {
    util::WithStorageRetry(options_.storage_retry, "journal.shred", [&] {
      auto tx = repository_->Begin();
      db::ThrowIfError(repository_->ShredEventPayload(*tx, event_id), "shred " + event_id);
      tx->Commit();
    });
    LEDGER_LOG_INFO("event payload shredded", {StringField("event_id", event_id)});
  });
}

void EventJournal::SetAppendObserver(AppendObserver observer) {
  std::lock_guard lock(observer_mutex_);
  observer_ = std::move(observer);
}

std::vector<model::Event> EventJournal::ReadPage(const std::string& stream_id, uint64_t from_version, uint64_t to_version,
                                                 uint64_t max_count) const {
  return util::WithStorageRetry(options_.storage_retry, "journal.read", [&] {
    auto tx     = repository_->Begin();
    auto events = repository_->ReadEvents(*tx, stream_id, from_version, to_version, max_count);
    tx->Commit();
    return events;
  });
}

void EventJournal::NotifyObserver(const AppendResult& result) const {
  AppendObserver observer;
  {
    std::lock_guard lock(observer_mutex_);
    observer = observer_;
  }
  if (!observer) return;

  try {
    observer(result);
  } catch (const std::exception& e) {
    // the append is committed; dispatch is re-driven by catch-up
    LEDGER_LOG_ERROR("append observer failed",
                     {StringField("stream", result.stream_id), UintField("version", result.committed_version), StringField("error", e.what())});
  }
}

} // namespace ledger::journal
