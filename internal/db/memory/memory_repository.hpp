#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ledger::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& stream_id) override;
  std::vector<model::StreamRecord> ListStreams(Transaction&) override;
  Result AppendEvents(Transaction&, const std::string& stream_id, uint64_t expected_version,
                      std::vector<model::EventRecord>& events) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& stream_id, uint64_t from_version,
                                             uint64_t to_version, std::optional<uint64_t> max_count) override;
  std::optional<model::EventRecord> GetEventById(Transaction&, const std::string& event_id) override;
  Result ShredEventPayload(Transaction&, const std::string& event_id) override;

  Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& stream_id) override;
  Result DeleteSnapshotsBefore(Transaction&, const std::string& stream_id, uint64_t version) override;

  Result UpsertCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& projection,
                                                       const std::string& stream_id) override;
  std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&, const std::string& projection) override;
  Result DeleteCheckpoints(Transaction&, const std::string& projection) override;

  Result UpsertReadModel(Transaction&, const model::ReadModelRecord&) override;
  std::optional<model::ReadModelRecord> GetReadModel(Transaction&, const std::string& projection, const std::string& key) override;
  Result DeleteReadModel(Transaction&, const std::string& projection, const std::string& key) override;
  Result DeleteReadModels(Transaction&, const std::string& projection) override;

  Result UpsertProjectionAlias(Transaction&, const std::string& alias, const std::string& projection) override;
  std::optional<std::string> GetProjectionAlias(Transaction&, const std::string& alias) override;

  Result UpsertDlqEntry(Transaction&, const model::DlqEntryRecord&) override;
  std::optional<model::DlqEntryRecord> GetDlqEntry(Transaction&, const std::string& projection,
                                                   const std::string& stream_id) override;
  std::vector<model::DlqEntryRecord> ListDlqEntries(Transaction&) override;
  Result DeleteDlqEntry(Transaction&, const std::string& projection, const std::string& stream_id) override;
  Result DeleteDlqEntries(Transaction&, const std::string& projection) override;

private:
  friend class MemoryTransaction;

  using PairKey = std::pair<std::string, std::string>;

  struct EventLocation {
    std::string stream_id;
    uint64_t    version = 0;
  };

  struct State {
    std::unordered_map<std::string, model::StreamRecord> streams;
    // events[stream][version - 1]
    std::unordered_map<std::string, std::vector<model::EventRecord>> events;
    std::unordered_map<std::string, EventLocation> event_index;

    // ascending by version
    std::unordered_map<std::string, std::vector<model::SnapshotRecord>> snapshots;

    // keyed by (projection, stream_id) / (projection, key)
    std::map<PairKey, model::CheckpointRecord> checkpoints;
    std::map<PairKey, model::ReadModelRecord> read_models;
    std::map<PairKey, model::DlqEntryRecord> dlq;
    std::map<std::string, std::string> aliases;
  };

  // Held for the whole life of a MemoryTransaction: one writer at a time.
  std::mutex tx_mutex_;
  State committed_;
};

} // namespace ledger::db::memory
