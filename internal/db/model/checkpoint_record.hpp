#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  Idempotency anchor: last event version a projection durably applied
  for one stream. Written in the same transaction as the read model.
*/
struct CheckpointRecord {
  std::string projection;
  std::string stream_id;
  uint64_t    last_applied_version = 0;
  uint64_t    updated_at_ms        = 0;
};

} // namespace ledger::db::model
