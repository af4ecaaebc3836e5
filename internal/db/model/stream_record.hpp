#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  Stream head row.

  version is the sequence number of the last committed event
  (0 = no events). It only ever moves forward by the size of a batch.
*/
struct StreamRecord {
  std::string stream_id;
  uint64_t    version       = 0;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace ledger::db::model
