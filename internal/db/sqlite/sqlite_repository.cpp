#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::db::sqlite {

using ledger::db::ErrorCode;
using ledger::db::Result;

namespace {

// Owns one prepared statement for the duration of a call.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  sqlite3_stmt* Get() const {
    return st_;
  }
  int PrepareCode() const {
    return rc_;
  }

  // Throwing variant for read paths.
  sqlite3_stmt* Require() const {
    if (!Ok()) throw util::StorageFailure(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    return st_;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  // data() is never null, so an empty string binds as a zero-length blob
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  int         size = sqlite3_column_bytes(st, col);
  if (!data || size <= 0) return {};
  return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Steps a read statement; false at end of rows.
bool NextRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::StorageFailure(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

model::StreamRecord ReadStream(sqlite3_stmt* st) {
  model::StreamRecord r;
  r.stream_id     = ColText(st, 0);
  r.version       = ColU64(st, 1);
  r.created_at_ms = ColU64(st, 2);
  r.updated_at_ms = ColU64(st, 3);
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.event_id       = ColText(st, 0);
  r.stream_id      = ColText(st, 1);
  r.version        = ColU64(st, 2);
  r.type           = ColText(st, 3);
  r.payload        = ColBlob(st, 4);
  r.correlation_id = ColText(st, 5);
  r.causation_id   = ColText(st, 6);
  r.occurred_at_ms = ColU64(st, 7);
  r.recorded_at_ms = ColU64(st, 8);
  r.shredded       = sqlite3_column_int(st, 9) != 0;
  return r;
}

model::CheckpointRecord ReadCheckpoint(sqlite3_stmt* st) {
  model::CheckpointRecord r;
  r.projection           = ColText(st, 0);
  r.stream_id            = ColText(st, 1);
  r.last_applied_version = ColU64(st, 2);
  r.updated_at_ms        = ColU64(st, 3);
  return r;
}

model::DlqEntryRecord ReadDlqEntry(sqlite3_stmt* st) {
  model::DlqEntryRecord r;
  r.projection          = ColText(st, 0);
  r.stream_id           = ColText(st, 1);
  r.failed_at_version   = ColU64(st, 2);
  r.last_queued_version = ColU64(st, 3);
  r.reason              = ColText(st, 4);
  r.enqueued_at_ms      = ColU64(st, 5);
  r.updated_at_ms       = ColU64(st, 6);
  r.redrive_attempts    = static_cast<uint32_t>(sqlite3_column_int64(st, 7));
  r.next_redrive_at_ms  = ColU64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return Result::Err(ErrorCode::Conflict, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT_UNIQUE:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Streams + journal
// ------------------------------------------------------------------

std::optional<model::StreamRecord> SqliteRepository::GetStream(Transaction& t, const std::string& stream_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_STREAM);
  auto*     st = stmt.Require();

  BindText(st, 1, stream_id);
  if (!NextRow(db, st)) return std::nullopt;
  return ReadStream(st);
}

std::vector<model::StreamRecord> SqliteRepository::ListStreams(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::LIST_STREAMS);
  auto*     st = stmt.Require();

  std::vector<model::StreamRecord> out;
  while (NextRow(db, st)) {
    out.push_back(ReadStream(st));
  }
  return out;
}

Result SqliteRepository::AppendEvents(Transaction& t, const std::string& stream_id, uint64_t expected_version,
                                      std::vector<model::EventRecord>& events) {
  auto* db = TX(t).Handle();

  std::optional<model::StreamRecord> stream;
  try {
    stream = GetStream(t, stream_id);
  } catch (const util::StorageFailure& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  }

  const uint64_t current = stream ? stream->version : 0;
  if (current != expected_version) {
    return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " is at version " + std::to_string(current) + ", expected " +
                                                std::to_string(expected_version));
  }

  const uint64_t now = util::NowMillis();

  if (!stream) {
    Statement stmt(db, sql::INSERT_STREAM);
    if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());
    BindText(stmt.Get(), 1, stream_id);
    BindU64(stmt.Get(), 2, now);
    BindU64(stmt.Get(), 3, now);
    // PRIMARYKEY here means another writer created the stream first
    if (auto r = Translate(db, sqlite3_step(stmt.Get())); !r) return r;
  }

  Statement insert(db, sql::INSERT_EVENT);
  if (!insert.Ok()) return Translate(db, insert.PrepareCode());

  uint64_t version = current;
  for (auto& e : events) {
    e.stream_id = stream_id;
    e.version   = ++version;
    if (e.recorded_at_ms == 0) e.recorded_at_ms = now;

    auto* st = insert.Get();
    sqlite3_reset(st);
    sqlite3_clear_bindings(st);
    BindText(st, 1, e.stream_id);
    BindU64(st, 2, e.version);
    BindText(st, 3, e.event_id);
    BindText(st, 4, e.type);
    BindBlob(st, 5, e.payload);
    BindText(st, 6, e.correlation_id);
    BindText(st, 7, e.causation_id);
    BindU64(st, 8, e.occurred_at_ms);
    BindU64(st, 9, e.recorded_at_ms);

    if (auto r = Translate(db, sqlite3_step(st)); !r) return r;
  }

  Statement advance(db, sql::ADVANCE_STREAM);
  if (!advance.Ok()) return Translate(db, advance.PrepareCode());
  BindU64(advance.Get(), 1, version);
  BindU64(advance.Get(), 2, now);
  BindText(advance.Get(), 3, stream_id);
  BindU64(advance.Get(), 4, current);
  if (auto r = Translate(db, sqlite3_step(advance.Get())); !r) return r;
  if (sqlite3_changes(db) != 1) {
    return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " moved during append");
  }
  return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, const std::string& stream_id, uint64_t from_version,
                                                             uint64_t to_version, std::optional<uint64_t> max_count) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_EVENTS_RANGE);
  auto*     st = stmt.Require();

  BindText(st, 1, stream_id);
  BindU64(st, 2, from_version);
  // sqlite integers are signed; clamp the open upper bound
  BindU64(st, 3, std::min<uint64_t>(to_version, static_cast<uint64_t>(INT64_MAX)));
  // negative LIMIT means unbounded
  sqlite3_bind_int64(st, 4, max_count ? static_cast<sqlite3_int64>(*max_count) : -1);

  std::vector<model::EventRecord> out;
  while (NextRow(db, st)) {
    out.push_back(ReadEvent(st));
  }
  return out;
}

std::optional<model::EventRecord> SqliteRepository::GetEventById(Transaction& t, const std::string& event_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_EVENT_BY_ID);
  auto*     st = stmt.Require();

  BindText(st, 1, event_id);
  if (!NextRow(db, st)) return std::nullopt;
  return ReadEvent(st);
}

Result SqliteRepository::ShredEventPayload(Transaction& t, const std::string& event_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SHRED_EVENT);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, event_id);
  if (auto r = Translate(db, sqlite3_step(stmt.Get())); !r) return r;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "event " + event_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::INSERT_SNAPSHOT);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  auto* st = stmt.Get();
  BindText(st, 1, r.stream_id);
  BindU64(st, 2, r.version);
  BindBlob(st, 3, r.state);
  BindU64(st, 4, r.taken_at_ms);

  auto result = Translate(db, sqlite3_step(st));
  if (result.code == ErrorCode::Conflict) {
    return Result::Err(ErrorCode::AlreadyExists, result.message);
  }
  return result;
}

std::optional<model::SnapshotRecord> SqliteRepository::GetLatestSnapshot(Transaction& t, const std::string& stream_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_LATEST_SNAPSHOT);
  auto*     st = stmt.Require();

  BindText(st, 1, stream_id);
  if (!NextRow(db, st)) return std::nullopt;

  model::SnapshotRecord r;
  r.stream_id   = ColText(st, 0);
  r.version     = ColU64(st, 1);
  r.state       = ColBlob(st, 2);
  r.taken_at_ms = ColU64(st, 3);
  return r;
}

Result SqliteRepository::DeleteSnapshotsBefore(Transaction& t, const std::string& stream_id, uint64_t version) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::DELETE_SNAPSHOTS_BEFORE);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, stream_id);
  BindU64(stmt.Get(), 2, version);
  return Translate(db, sqlite3_step(stmt.Get()));
}

// ------------------------------------------------------------------
// Checkpoints + read models
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::UPSERT_CHECKPOINT);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  auto* st = stmt.Get();
  BindText(st, 1, r.projection);
  BindText(st, 2, r.stream_id);
  BindU64(st, 3, r.last_applied_version);
  BindU64(st, 4, r.updated_at_ms);
  return Translate(db, sqlite3_step(st));
}

std::optional<model::CheckpointRecord> SqliteRepository::GetCheckpoint(Transaction& t, const std::string& projection,
                                                                       const std::string& stream_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_CHECKPOINT);
  auto*     st = stmt.Require();

  BindText(st, 1, projection);
  BindText(st, 2, stream_id);
  if (!NextRow(db, st)) return std::nullopt;
  return ReadCheckpoint(st);
}

std::vector<model::CheckpointRecord> SqliteRepository::ListCheckpoints(Transaction& t, const std::string& projection) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::LIST_CHECKPOINTS);
  auto*     st = stmt.Require();

  BindText(st, 1, projection);
  std::vector<model::CheckpointRecord> out;
  while (NextRow(db, st)) {
    out.push_back(ReadCheckpoint(st));
  }
  return out;
}

Result SqliteRepository::DeleteCheckpoints(Transaction& t, const std::string& projection) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::DELETE_CHECKPOINTS);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, projection);
  return Translate(db, sqlite3_step(stmt.Get()));
}

Result SqliteRepository::UpsertReadModel(Transaction& t, const model::ReadModelRecord& r) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::UPSERT_READ_MODEL);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  auto* st = stmt.Get();
  BindText(st, 1, r.projection);
  BindText(st, 2, r.key);
  BindBlob(st, 3, r.value);
  BindU64(st, 4, r.version);
  BindU64(st, 5, r.updated_at_ms);
  return Translate(db, sqlite3_step(st));
}

std::optional<model::ReadModelRecord> SqliteRepository::GetReadModel(Transaction& t, const std::string& projection,
                                                                     const std::string& key) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_READ_MODEL);
  auto*     st = stmt.Require();

  BindText(st, 1, projection);
  BindText(st, 2, key);
  if (!NextRow(db, st)) return std::nullopt;

  model::ReadModelRecord r;
  r.projection    = ColText(st, 0);
  r.key           = ColText(st, 1);
  r.value         = ColBlob(st, 2);
  r.version       = ColU64(st, 3);
  r.updated_at_ms = ColU64(st, 4);
  return r;
}

Result SqliteRepository::DeleteReadModel(Transaction& t, const std::string& projection, const std::string& key) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::DELETE_READ_MODEL);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, projection);
  BindText(stmt.Get(), 2, key);
  return Translate(db, sqlite3_step(stmt.Get()));
}

Result SqliteRepository::DeleteReadModels(Transaction& t, const std::string& projection) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::DELETE_READ_MODELS);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, projection);
  return Translate(db, sqlite3_step(stmt.Get()));
}

Result SqliteRepository::UpsertProjectionAlias(Transaction& t, const std::string& alias, const std::string& projection) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::UPSERT_ALIAS);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, alias);
  BindText(stmt.Get(), 2, projection);
  BindU64(stmt.Get(), 3, util::NowMillis());
  return Translate(db, sqlite3_step(stmt.Get()));
}

std::optional<std::string> SqliteRepository::GetProjectionAlias(Transaction& t, const std::string& alias) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_ALIAS);
  auto*     st = stmt.Require();

  BindText(st, 1, alias);
  if (!NextRow(db, st)) return std::nullopt;
  return ColText(st, 0);
}

// ------------------------------------------------------------------
// Dead-letter queue
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDlqEntry(Transaction& t, const model::DlqEntryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::UPSERT_DLQ_ENTRY);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  auto* st = stmt.Get();
  BindText(st, 1, r.projection);
  BindText(st, 2, r.stream_id);
  BindU64(st, 3, r.failed_at_version);
  BindU64(st, 4, r.last_queued_version);
  BindText(st, 5, r.reason);
  BindU64(st, 6, r.enqueued_at_ms);
  BindU64(st, 7, r.updated_at_ms);
  BindU64(st, 8, r.redrive_attempts);
  BindU64(st, 9, r.next_redrive_at_ms);
  return Translate(db, sqlite3_step(st));
}

std::optional<model::DlqEntryRecord> SqliteRepository::GetDlqEntry(Transaction& t, const std::string& projection,
                                                                   const std::string& stream_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_DLQ_ENTRY);
  auto*     st = stmt.Require();

  BindText(st, 1, projection);
  BindText(st, 2, stream_id);
  if (!NextRow(db, st)) return std::nullopt;
  return ReadDlqEntry(st);
}

std::vector<model::DlqEntryRecord> SqliteRepository::ListDlqEntries(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::LIST_DLQ_ENTRIES);
  auto*     st = stmt.Require();

  std::vector<model::DlqEntryRecord> out;
  while (NextRow(db, st)) {
    out.push_back(ReadDlqEntry(st));
  }
  return out;
}

Result SqliteRepository::DeleteDlqEntry(Transaction& t, const std::string& projection, const std::string& stream_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::DELETE_DLQ_ENTRY);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, projection);
  BindText(stmt.Get(), 2, stream_id);
  return Translate(db, sqlite3_step(stmt.Get()));
}

Result SqliteRepository::DeleteDlqEntries(Transaction& t, const std::string& projection) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::DELETE_DLQ_ENTRIES);
  if (!stmt.Ok()) return Translate(db, stmt.PrepareCode());

  BindText(stmt.Get(), 1, projection);
  return Translate(db, sqlite3_step(stmt.Get()));
}

} // namespace ledger::db::sqlite
