#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/journal/event_cursor.hpp"
#include "internal/model/event.hpp"
#include "internal/util/retry.hpp"

namespace ledger::journal {

struct JournalOptions {
  uint32_t          read_batch_size = 256;
  util::RetryPolicy storage_retry;
};

struct AppendResult {
  std::string               stream_id;
  uint64_t                  first_version     = 0;
  uint64_t                  committed_version = 0;
  std::vector<model::Event> events;
};

// Called after a successful commit, outside any transaction.
using AppendObserver = std::function<void(const AppendResult&)>;

/*
  Append-only event journal.

  Versions within a stream are 1..N with no gaps. Append is all or
  nothing and succeeds only when the stream is still at the caller's
  expected version; a stream that was never written is at version 0.
*/
class EventJournal {
 public:
  explicit EventJournal(std::shared_ptr<db::Repository> repository, JournalOptions options = {});

  // Throws VersionConflict, AlreadyExists (duplicate event id),
  // InvalidArgument (empty batch / stream id / type) or StorageFailure.
  AppendResult Append(const std::string& stream_id, uint64_t expected_version, std::vector<model::NewEvent> events);

  // Cursor over [from_version, min(to_version, head at call time)].
  EventCursor Read(const std::string& stream_id, uint64_t from_version = 1,
                   std::optional<uint64_t> to_version = std::nullopt) const;

  uint64_t                             StreamVersion(const std::string& stream_id) const;
  std::vector<db::model::StreamRecord> ListStreams() const;
  std::optional<model::Event>          FindEvent(const std::string& event_id) const;

  // Crypto-shredding: clears the payload bytes, keeps all metadata.
  void ShredPayload(const std::string& event_id);

  void SetAppendObserver(AppendObserver observer);

  // One page of committed events, used by EventCursor.
  std::vector<model::Event> ReadPage(const std::string& stream_id, uint64_t from_version, uint64_t to_version,
                                     uint64_t max_count) const;

  const JournalOptions& Options() const {
    return options_;
  }

  db::Repository& Repository() const {
    return *repository_;
  }

 private:
  void NotifyObserver(const AppendResult& result) const;

  std::shared_ptr<db::Repository> repository_;
  JournalOptions                  options_;

  mutable std::mutex observer_mutex_;
  AppendObserver     observer_;
};

} // namespace ledger::journal
