#include "pg_repository.hpp"

#include <algorithm>
#include <cstdint>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::db::postgres {

namespace {

// BYTEA columns travel as hex text: decode($n,'hex') / encode(col,'hex').
std::string ToHex(const std::string& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kDigits[c >> 4]);
    out.push_back(kDigits[c & 0x0f]);
  }
  return out;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  throw util::StorageFailure("invalid hex digit in bytea column");
}

std::string FromHex(std::string_view hex) {
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<char>((HexValue(hex[i]) << 4) | HexValue(hex[i + 1])));
  }
  return out;
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

// Reads report backend failures as StorageFailure.
template <typename Fn>
auto Guarded(const char* op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StorageFailure(std::string(op) + ": " + e.what());
  }
}

constexpr const char* kEventColumns =
    "event_id,stream_id,version,type,encode(payload,'hex'),correlation_id,causation_id,occurred_at_ms,recorded_at_ms,shredded";

model::StreamRecord ReadStream(const pqxx::row& row) {
  model::StreamRecord r;
  r.stream_id     = row[0].c_str();
  r.version       = row[1].as<uint64_t>();
  r.created_at_ms = row[2].as<uint64_t>();
  r.updated_at_ms = row[3].as<uint64_t>();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.event_id       = row[0].c_str();
  r.stream_id      = row[1].c_str();
  r.version        = row[2].as<uint64_t>();
  r.type           = row[3].c_str();
  r.payload        = FromHex(row[4].c_str());
  r.correlation_id = TextOrEmpty(row[5]);
  r.causation_id   = TextOrEmpty(row[6]);
  r.occurred_at_ms = row[7].as<uint64_t>();
  r.recorded_at_ms = row[8].as<uint64_t>();
  r.shredded       = row[9].as<bool>();
  return r;
}

model::CheckpointRecord ReadCheckpoint(const pqxx::row& row) {
  model::CheckpointRecord r;
  r.projection           = row[0].c_str();
  r.stream_id            = row[1].c_str();
  r.last_applied_version = row[2].as<uint64_t>();
  r.updated_at_ms        = row[3].as<uint64_t>();
  return r;
}

model::DlqEntryRecord ReadDlqEntry(const pqxx::row& row) {
  model::DlqEntryRecord r;
  r.projection          = row[0].c_str();
  r.stream_id           = row[1].c_str();
  r.failed_at_version   = row[2].as<uint64_t>();
  r.last_queued_version = row[3].as<uint64_t>();
  r.reason              = row[4].c_str();
  r.enqueued_at_ms      = row[5].as<uint64_t>();
  r.updated_at_ms       = row[6].as<uint64_t>();
  r.redrive_attempts    = row[7].as<uint32_t>();
  r.next_redrive_at_ms  = row[8].as<uint64_t>();
  return r;
}

constexpr const char* kDlqColumns =
    "projection,stream_id,failed_at_version,last_queued_version,reason,enqueued_at_ms,updated_at_ms,redrive_attempts,next_redrive_at_ms";

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Streams + journal
// ------------------------------------------------------------------

std::optional<model::StreamRecord> PgRepository::GetStream(Transaction& t, const std::string& stream_id) {
  return Guarded("get stream", [&]() -> std::optional<model::StreamRecord> {
    auto res = TX(t).Work().exec_params("SELECT stream_id,version,created_at_ms,updated_at_ms FROM streams WHERE stream_id=$1;", stream_id);
    if (res.empty()) return std::nullopt;
    return ReadStream(res[0]);
  });
}

std::vector<model::StreamRecord> PgRepository::ListStreams(Transaction& t) {
  return Guarded("list streams", [&] {
    auto res = TX(t).Work().exec("SELECT stream_id,version,created_at_ms,updated_at_ms FROM streams ORDER BY stream_id;");

    std::vector<model::StreamRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadStream(row));
    }
    return out;
  });
}

Result PgRepository::AppendEvents(Transaction& t, const std::string& stream_id, uint64_t expected_version,
                                  std::vector<model::EventRecord>& events) {
  auto&          w   = TX(t).Work();
  const uint64_t now = util::NowMillis();

  try {
    // row lock: concurrent appenders on this stream queue up here
    auto     res     = w.exec_params("SELECT version FROM streams WHERE stream_id=$1 FOR UPDATE;", stream_id);
    uint64_t current = res.empty() ? 0 : res[0][0].as<uint64_t>();
    if (current != expected_version) {
      return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " is at version " + std::to_string(current) + ", expected " +
                                                  std::to_string(expected_version));
    }

    if (res.empty()) {
      auto created = w.exec_params(
          "INSERT INTO streams(stream_id,version,created_at_ms,updated_at_ms) VALUES($1,0,$2,$2) ON CONFLICT(stream_id) DO NOTHING;",
          stream_id, now);
      if (created.affected_rows() == 0) {
        return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " created concurrently");
      }
    }

    uint64_t version = current;
    for (auto& e : events) {
      e.stream_id = stream_id;
      e.version   = ++version;
      if (e.recorded_at_ms == 0) e.recorded_at_ms = now;

      w.exec_params(
          "INSERT INTO events(stream_id,version,event_id,type,payload,correlation_id,causation_id,occurred_at_ms,recorded_at_ms)"
          " VALUES($1,$2,$3,$4,decode($5,'hex'),$6,$7,$8,$9);",
          e.stream_id, e.version, e.event_id, e.type, ToHex(e.payload), e.correlation_id, e.causation_id, e.occurred_at_ms,
          e.recorded_at_ms);
    }

    auto advanced = w.exec_params("UPDATE streams SET version=$1,updated_at_ms=$2 WHERE stream_id=$3 AND version=$4;", version, now,
                                  stream_id, current);
    if (advanced.affected_rows() != 1) {
      return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " moved during append");
    }
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    // events_pkey means another writer took the version; the event_id key is a duplicate id
    const std::string what = e.what();
    if (what.find("event_id") != std::string::npos) {
      return Result::Err(ErrorCode::AlreadyExists, what);
    }
    return Result::Err(ErrorCode::Conflict, what);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, const std::string& stream_id, uint64_t from_version,
                                                         uint64_t to_version, std::optional<uint64_t> max_count) {
  return Guarded("read events", [&] {
    const uint64_t upper = std::min<uint64_t>(to_version, static_cast<uint64_t>(INT64_MAX));
    const uint64_t limit = max_count ? std::min<uint64_t>(*max_count, static_cast<uint64_t>(INT64_MAX)) : static_cast<uint64_t>(INT64_MAX);

    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEventColumns +
                                            " FROM events WHERE stream_id=$1 AND version>=$2 AND version<=$3 ORDER BY version LIMIT $4;",
                                        stream_id, from_version, upper, limit);

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadEvent(row));
    }
    return out;
  });
}

std::optional<model::EventRecord> PgRepository::GetEventById(Transaction& t, const std::string& event_id) {
  return Guarded("get event", [&]() -> std::optional<model::EventRecord> {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEventColumns + " FROM events WHERE event_id=$1;", event_id);
    if (res.empty()) return std::nullopt;
    return ReadEvent(res[0]);
  });
}

Result PgRepository::ShredEventPayload(Transaction& t, const std::string& event_id) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE events SET payload='\\x'::bytea,shredded=TRUE WHERE event_id=$1;", event_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "event " + event_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result PgRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO snapshots(stream_id,version,state,taken_at_ms) VALUES($1,$2,decode($3,'hex'),$4);", r.stream_id,
                             r.version, ToHex(r.state), r.taken_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SnapshotRecord> PgRepository::GetLatestSnapshot(Transaction& t, const std::string& stream_id) {
  return Guarded("get snapshot", [&]() -> std::optional<model::SnapshotRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT stream_id,version,encode(state,'hex'),taken_at_ms FROM snapshots WHERE stream_id=$1 ORDER BY version DESC LIMIT 1;",
        stream_id);
    if (res.empty()) return std::nullopt;

    model::SnapshotRecord r;
    r.stream_id   = res[0][0].c_str();
    r.version     = res[0][1].as<uint64_t>();
    r.state       = FromHex(res[0][2].c_str());
    r.taken_at_ms = res[0][3].as<uint64_t>();
    return r;
  });
}

Result PgRepository::DeleteSnapshotsBefore(Transaction& t, const std::string& stream_id, uint64_t version) {
  try {
    TX(t).Work().exec_params("DELETE FROM snapshots WHERE stream_id=$1 AND version<$2;", stream_id, version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Checkpoints + read models
// ------------------------------------------------------------------

Result PgRepository::UpsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO checkpoints(projection,stream_id,last_applied_version,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(projection,stream_id) DO UPDATE SET last_applied_version=EXCLUDED.last_applied_version,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.projection, r.stream_id, r.last_applied_version, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CheckpointRecord> PgRepository::GetCheckpoint(Transaction& t, const std::string& projection,
                                                                   const std::string& stream_id) {
  return Guarded("get checkpoint", [&]() -> std::optional<model::CheckpointRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT projection,stream_id,last_applied_version,updated_at_ms FROM checkpoints WHERE projection=$1 AND stream_id=$2;", projection,
        stream_id);
    if (res.empty()) return std::nullopt;
    return ReadCheckpoint(res[0]);
  });
}

std::vector<model::CheckpointRecord> PgRepository::ListCheckpoints(Transaction& t, const std::string& projection) {
  return Guarded("list checkpoints", [&] {
    auto res = TX(t).Work().exec_params(
        "SELECT projection,stream_id,last_applied_version,updated_at_ms FROM checkpoints WHERE projection=$1 ORDER BY stream_id;", projection);

    std::vector<model::CheckpointRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadCheckpoint(row));
    }
    return out;
  });
}

Result PgRepository::DeleteCheckpoints(Transaction& t, const std::string& projection) {
  try {
    TX(t).Work().exec_params("DELETE FROM checkpoints WHERE projection=$1;", projection);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertReadModel(Transaction& t, const model::ReadModelRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO read_models(projection,key,value,version,updated_at_ms) VALUES($1,$2,decode($3,'hex'),$4,$5) "
        "ON CONFLICT(projection,key) DO UPDATE SET value=EXCLUDED.value,version=EXCLUDED.version,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.projection, r.key, ToHex(r.value), r.version, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReadModelRecord> PgRepository::GetReadModel(Transaction& t, const std::string& projection, const std::string& key) {
  return Guarded("get read model", [&]() -> std::optional<model::ReadModelRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT projection,key,encode(value,'hex'),version,updated_at_ms FROM read_models WHERE projection=$1 AND key=$2;", projection, key);
    if (res.empty()) return std::nullopt;

    model::ReadModelRecord r;
    r.projection    = res[0][0].c_str();
    r.key           = res[0][1].c_str();
    r.value         = FromHex(res[0][2].c_str());
    r.version       = res[0][3].as<uint64_t>();
    r.updated_at_ms = res[0][4].as<uint64_t>();
    return r;
  });
}

Result PgRepository::DeleteReadModel(Transaction& t, const std::string& projection, const std::string& key) {
  try {
    TX(t).Work().exec_params("DELETE FROM read_models WHERE projection=$1 AND key=$2;", projection, key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteReadModels(Transaction& t, const std::string& projection) {
  try {
    TX(t).Work().exec_params("DELETE FROM read_models WHERE projection=$1;", projection);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertProjectionAlias(Transaction& t, const std::string& alias, const std::string& projection) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO projection_aliases(alias,projection,updated_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(alias) DO UPDATE SET projection=EXCLUDED.projection,updated_at_ms=EXCLUDED.updated_at_ms;",
        alias, projection, util::NowMillis());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::GetProjectionAlias(Transaction& t, const std::string& alias) {
  return Guarded("get alias", [&]() -> std::optional<std::string> {
    auto res = TX(t).Work().exec_params("SELECT projection FROM projection_aliases WHERE alias=$1;", alias);
    if (res.empty()) return std::nullopt;
    return std::string(res[0][0].c_str());
  });
}

// ------------------------------------------------------------------
// Dead-letter queue
// ------------------------------------------------------------------

Result PgRepository::UpsertDlqEntry(Transaction& t, const model::DlqEntryRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO dlq_entries(projection,stream_id,failed_at_version,last_queued_version,reason,enqueued_at_ms,updated_at_ms,"
        "redrive_attempts,next_redrive_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
        "ON CONFLICT(projection,stream_id) DO UPDATE SET failed_at_version=EXCLUDED.failed_at_version,"
        "last_queued_version=EXCLUDED.last_queued_version,reason=EXCLUDED.reason,updated_at_ms=EXCLUDED.updated_at_ms,"
        "redrive_attempts=EXCLUDED.redrive_attempts,next_redrive_at_ms=EXCLUDED.next_redrive_at_ms;",
        r.projection, r.stream_id, r.failed_at_version, r.last_queued_version, r.reason, r.enqueued_at_ms, r.updated_at_ms,
        r.redrive_attempts, r.next_redrive_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DlqEntryRecord> PgRepository::GetDlqEntry(Transaction& t, const std::string& projection, const std::string& stream_id) {
  return Guarded("get dlq entry", [&]() -> std::optional<model::DlqEntryRecord> {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kDlqColumns + " FROM dlq_entries WHERE projection=$1 AND stream_id=$2;",
                                        projection, stream_id);
    if (res.empty()) return std::nullopt;
    return ReadDlqEntry(res[0]);
  });
}

std::vector<model::DlqEntryRecord> PgRepository::ListDlqEntries(Transaction& t) {
  return Guarded("list dlq entries", [&] {
    auto res = TX(t).Work().exec(std::string("SELECT ") + kDlqColumns + " FROM dlq_entries ORDER BY projection,stream_id;");

    std::vector<model::DlqEntryRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadDlqEntry(row));
    }
    return out;
  });
}

Result PgRepository::DeleteDlqEntry(Transaction& t, const std::string& projection, const std::string& stream_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM dlq_entries WHERE projection=$1 AND stream_id=$2;", projection, stream_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDlqEntries(Transaction& t, const std::string& projection) {
  try {
    TX(t).Work().exec_params("DELETE FROM dlq_entries WHERE projection=$1;", projection);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace ledger::db::postgres
