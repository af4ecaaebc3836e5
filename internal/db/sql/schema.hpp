#pragma once

#include <string>
#include <vector>

namespace ledger::db::sql {

/*
  Journal schema.

  events is keyed by (stream_id, version): the primary key is the
  last line of defence for optimistic appends. event_id is unique
  across all streams.
*/

inline std::vector<std::string> SqliteSchema() {
  return {
      "CREATE TABLE IF NOT EXISTS streams ("
      " stream_id TEXT PRIMARY KEY,"
      " version INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS events ("
      " stream_id TEXT NOT NULL REFERENCES streams(stream_id),"
      " version INTEGER NOT NULL,"
      " event_id TEXT NOT NULL UNIQUE,"
      " type TEXT NOT NULL,"
      " payload BLOB NOT NULL,"
      " correlation_id TEXT NOT NULL DEFAULT '',"
      " causation_id TEXT NOT NULL DEFAULT '',"
      " occurred_at_ms INTEGER NOT NULL,"
      " recorded_at_ms INTEGER NOT NULL,"
      " shredded INTEGER NOT NULL DEFAULT 0,"
      " PRIMARY KEY(stream_id, version));",

      "CREATE TABLE IF NOT EXISTS snapshots ("
      " stream_id TEXT NOT NULL,"
      " version INTEGER NOT NULL,"
      " state BLOB NOT NULL,"
      " taken_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY(stream_id, version));",

      "CREATE TABLE IF NOT EXISTS checkpoints ("
      " projection TEXT NOT NULL,"
      " stream_id TEXT NOT NULL,"
      " last_applied_version INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY(projection, stream_id));",

      "CREATE TABLE IF NOT EXISTS read_models ("
      " projection TEXT NOT NULL,"
      " key TEXT NOT NULL,"
      " value BLOB NOT NULL,"
      " version INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY(projection, key));",

      "CREATE TABLE IF NOT EXISTS projection_aliases ("
      " alias TEXT PRIMARY KEY,"
      " projection TEXT NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS dlq_entries ("
      " projection TEXT NOT NULL,"
      " stream_id TEXT NOT NULL,"
      " failed_at_version INTEGER NOT NULL,"
      " last_queued_version INTEGER NOT NULL,"
      " reason TEXT NOT NULL,"
      " enqueued_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " redrive_attempts INTEGER NOT NULL DEFAULT 0,"
      " next_redrive_at_ms INTEGER NOT NULL DEFAULT 0,"
      " PRIMARY KEY(projection, stream_id));",
  };
}

inline std::vector<std::string> PostgresSchema() {
  return {
      "CREATE TABLE IF NOT EXISTS streams ("
      " stream_id TEXT PRIMARY KEY,"
      " version BIGINT NOT NULL,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS events ("
      " stream_id TEXT NOT NULL REFERENCES streams(stream_id),"
      " version BIGINT NOT NULL,"
      " event_id TEXT NOT NULL UNIQUE,"
      " type TEXT NOT NULL,"
      " payload BYTEA NOT NULL,"
      " correlation_id TEXT NOT NULL DEFAULT '',"
      " causation_id TEXT NOT NULL DEFAULT '',"
      " occurred_at_ms BIGINT NOT NULL,"
      " recorded_at_ms BIGINT NOT NULL,"
      " shredded BOOLEAN NOT NULL DEFAULT FALSE,"
      " PRIMARY KEY(stream_id, version));",

      "CREATE TABLE IF NOT EXISTS snapshots ("
      " stream_id TEXT NOT NULL,"
      " version BIGINT NOT NULL,"
      " state BYTEA NOT NULL,"
      " taken_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY(stream_id, version));",

      "CREATE TABLE IF NOT EXISTS checkpoints ("
      " projection TEXT NOT NULL,"
      " stream_id TEXT NOT NULL,"
      " last_applied_version BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY(projection, stream_id));",

      "CREATE TABLE IF NOT EXISTS read_models ("
      " projection TEXT NOT NULL,"
      " key TEXT NOT NULL,"
      " value BYTEA NOT NULL,"
      " version BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY(projection, key));",

      "CREATE TABLE IF NOT EXISTS projection_aliases ("
      " alias TEXT PRIMARY KEY,"
      " projection TEXT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS dlq_entries ("
      " projection TEXT NOT NULL,"
      " stream_id TEXT NOT NULL,"
      " failed_at_version BIGINT NOT NULL,"
      " last_queued_version BIGINT NOT NULL,"
      " reason TEXT NOT NULL,"
      " enqueued_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " redrive_attempts INTEGER NOT NULL DEFAULT 0,"
      " next_redrive_at_ms BIGINT NOT NULL DEFAULT 0,"
      " PRIMARY KEY(projection, stream_id));",
  };
}

} // namespace ledger::db::sql
