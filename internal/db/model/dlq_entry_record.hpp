#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  Open quarantine for one (projection, stream).

  Queued events are the contiguous journal range
  [failed_at_version, last_queued_version].
*/
struct DlqEntryRecord {
  std::string projection;
  std::string stream_id;
  uint64_t    failed_at_version   = 0;
  uint64_t    last_queued_version = 0;
  std::string reason;
  uint64_t    enqueued_at_ms     = 0;
  uint64_t    updated_at_ms      = 0;
  uint32_t    redrive_attempts   = 0;
  uint64_t    next_redrive_at_ms = 0;
};

} // namespace ledger::db::model
