#pragma once

namespace ledger::db::sql {

/*
  Canonical SQL for the embedded backend.

  Written in the SQLite dialect with positional '?' parameters.
  The postgres repository carries its own $n variants.
*/

// streams + journal

static constexpr const char* SELECT_STREAM =
    "SELECT stream_id,version,created_at_ms,updated_at_ms"
    " FROM streams WHERE stream_id=?;";

static constexpr const char* LIST_STREAMS =
    "SELECT stream_id,version,created_at_ms,updated_at_ms"
    " FROM streams ORDER BY stream_id;";

static constexpr const char* INSERT_STREAM =
    "INSERT INTO streams(stream_id,version,created_at_ms,updated_at_ms)"
    " VALUES(?,0,?,?);";

static constexpr const char* ADVANCE_STREAM =
    "UPDATE streams SET version=?,updated_at_ms=?"
    " WHERE stream_id=? AND version=?;";

static constexpr const char* INSERT_EVENT =
    "INSERT INTO events(stream_id,version,event_id,type,payload,correlation_id,causation_id,occurred_at_ms,recorded_at_ms,shredded)"
    " VALUES(?,?,?,?,?,?,?,?,?,0);";

static constexpr const char* SELECT_EVENTS_RANGE =
    "SELECT event_id,stream_id,version,type,payload,correlation_id,causation_id,occurred_at_ms,recorded_at_ms,shredded"
    " FROM events WHERE stream_id=? AND version>=? AND version<=?"
    " ORDER BY version LIMIT ?;";

static constexpr const char* SELECT_EVENT_BY_ID =
    "SELECT event_id,stream_id,version,type,payload,correlation_id,causation_id,occurred_at_ms,recorded_at_ms,shredded"
    " FROM events WHERE event_id=?;";

static constexpr const char* SHRED_EVENT =
    "UPDATE events SET payload=x'',shredded=1 WHERE event_id=?;";

// snapshots

static constexpr const char* INSERT_SNAPSHOT =
    "INSERT INTO snapshots(stream_id,version,state,taken_at_ms) VALUES(?,?,?,?);";

static constexpr const char* SELECT_LATEST_SNAPSHOT =
    "SELECT stream_id,version,state,taken_at_ms FROM snapshots"
    " WHERE stream_id=? ORDER BY version DESC LIMIT 1;";

static constexpr const char* DELETE_SNAPSHOTS_BEFORE =
    "DELETE FROM snapshots WHERE stream_id=? AND version<?;";

// checkpoints + read models

static constexpr const char* UPSERT_CHECKPOINT =
    "INSERT INTO checkpoints(projection,stream_id,last_applied_version,updated_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(projection,stream_id) DO UPDATE SET"
    " last_applied_version=excluded.last_applied_version,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_CHECKPOINT =
    "SELECT projection,stream_id,last_applied_version,updated_at_ms"
    " FROM checkpoints WHERE projection=? AND stream_id=?;";

static constexpr const char* LIST_CHECKPOINTS =
    "SELECT projection,stream_id,last_applied_version,updated_at_ms"
    " FROM checkpoints WHERE projection=? ORDER BY stream_id;";

static constexpr const char* DELETE_CHECKPOINTS =
    "DELETE FROM checkpoints WHERE projection=?;";

static constexpr const char* UPSERT_READ_MODEL =
    "INSERT INTO read_models(projection,key,value,version,updated_at_ms)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(projection,key) DO UPDATE SET"
    " value=excluded.value,"
    " version=excluded.version,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_READ_MODEL =
    "SELECT projection,key,value,version,updated_at_ms"
    " FROM read_models WHERE projection=? AND key=?;";

static constexpr const char* DELETE_READ_MODEL =
    "DELETE FROM read_models WHERE projection=? AND key=?;";

static constexpr const char* DELETE_READ_MODELS =
    "DELETE FROM read_models WHERE projection=?;";

static constexpr const char* UPSERT_ALIAS =
    "INSERT INTO projection_aliases(alias,projection,updated_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(alias) DO UPDATE SET"
    " projection=excluded.projection,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_ALIAS =
    "SELECT projection FROM projection_aliases WHERE alias=?;";

// dead-letter queue

static constexpr const char* UPSERT_DLQ_ENTRY =
    "INSERT INTO dlq_entries(projection,stream_id,failed_at_version,last_queued_version,reason,"
    "enqueued_at_ms,updated_at_ms,redrive_attempts,next_redrive_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(projection,stream_id) DO UPDATE SET"
    " failed_at_version=excluded.failed_at_version,"
    " last_queued_version=excluded.last_queued_version,"
    " reason=excluded.reason,"
    " updated_at_ms=excluded.updated_at_ms,"
    " redrive_attempts=excluded.redrive_attempts,"
    " next_redrive_at_ms=excluded.next_redrive_at_ms;";

static constexpr const char* SELECT_DLQ_ENTRY =
    "SELECT projection,stream_id,failed_at_version,last_queued_version,reason,"
    "enqueued_at_ms,updated_at_ms,redrive_attempts,next_redrive_at_ms"
    " FROM dlq_entries WHERE projection=? AND stream_id=?;";

static constexpr const char* LIST_DLQ_ENTRIES =
    "SELECT projection,stream_id,failed_at_version,last_queued_version,reason,"
    "enqueued_at_ms,updated_at_ms,redrive_attempts,next_redrive_at_ms"
    " FROM dlq_entries ORDER BY projection,stream_id;";

static constexpr const char* DELETE_DLQ_ENTRY =
    "DELETE FROM dlq_entries WHERE projection=? AND stream_id=?;";

static constexpr const char* DELETE_DLQ_ENTRIES =
    "DELETE FROM dlq_entries WHERE projection=?;";

} // namespace ledger::db::sql
