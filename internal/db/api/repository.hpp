#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/db/model/dlq_entry_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/read_model_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/db/model/stream_record.hpp"

namespace ledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - AppendEvents checks the stream version and assigns versions
    in the same transaction (optimistic concurrency)
  - A projection's read-model rows and its checkpoint are written
    through the same transaction

  Writes report failures through Result. Reads throw
  util::StorageFailure when the backend fails.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Streams + journal
  // ---------------------------------------------------------------------

  virtual std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& stream_id) = 0;

  virtual std::vector<model::StreamRecord> ListStreams(Transaction&) = 0;

  // Creates the stream on first append. Returns Conflict when the current
  // version is not expected_version, AlreadyExists on a duplicate event id.
  // On success events carry their assigned versions.
  virtual Result AppendEvents(Transaction&, const std::string& stream_id, uint64_t expected_version,
                              std::vector<model::EventRecord>& events) = 0;

  // Inclusive version range, ascending. max_count bounds the page size.
  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& stream_id, uint64_t from_version,
                                                     uint64_t to_version, std::optional<uint64_t> max_count) = 0;

  virtual std::optional<model::EventRecord> GetEventById(Transaction&, const std::string& event_id) = 0;

  virtual Result ShredEventPayload(Transaction&, const std::string& event_id) = 0;

  // ---------------------------------------------------------------------
  // Snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& stream_id) = 0;

  virtual Result DeleteSnapshotsBefore(Transaction&, const std::string& stream_id, uint64_t version) = 0;

  // ---------------------------------------------------------------------
  // Projection checkpoints + read models
  // ---------------------------------------------------------------------

  virtual Result UpsertCheckpoint(Transaction&, const model::CheckpointRecord&) = 0;

  virtual std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& projection, const std::string& stream_id) = 0;

  virtual std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&, const std::string& projection) = 0;

  virtual Result DeleteCheckpoints(Transaction&, const std::string& projection) = 0;

  virtual Result UpsertReadModel(Transaction&, const model::ReadModelRecord&) = 0;

  virtual std::optional<model::ReadModelRecord> GetReadModel(Transaction&, const std::string& projection, const std::string& key) = 0;

  virtual Result DeleteReadModel(Transaction&, const std::string& projection, const std::string& key) = 0;

  virtual Result DeleteReadModels(Transaction&, const std::string& projection) = 0;

  virtual Result UpsertProjectionAlias(Transaction&, const std::string& alias, const std::string& projection) = 0;

  virtual std::optional<std::string> GetProjectionAlias(Transaction&, const std::string& alias) = 0;

  // ---------------------------------------------------------------------
  // Sequence dead-letter queue
  // ---------------------------------------------------------------------

  virtual Result UpsertDlqEntry(Transaction&, const model::DlqEntryRecord&) = 0;

  virtual std::optional<model::DlqEntryRecord> GetDlqEntry(Transaction&, const std::string& projection, const std::string& stream_id) = 0;

  virtual std::vector<model::DlqEntryRecord> ListDlqEntries(Transaction&) = 0;

  virtual Result DeleteDlqEntry(Transaction&, const std::string& projection, const std::string& stream_id) = 0;

  virtual Result DeleteDlqEntries(Transaction&, const std::string& projection) = 0;
};

} // namespace ledger::db
