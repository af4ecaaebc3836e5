#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace ledger::db::sqlite
