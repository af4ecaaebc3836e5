#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

struct SnapshotRecord {
  std::string stream_id;
  uint64_t    version = 0;
  std::string state; // opaque serialized aggregate state
  uint64_t    taken_at_ms = 0;
};

} // namespace ledger::db::model
