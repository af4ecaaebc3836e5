#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  Committed journal event. Immutable once written, except that
  crypto-shredding may clear payload bytes (shredded = true).
*/
struct EventRecord {
  std::string event_id;
  std::string stream_id;
  uint64_t    version = 0;
  std::string type;

  // opaque bytes (JSON, protobuf, CBOR, etc)
  std::string payload;

  std::string correlation_id;
  std::string causation_id;

  uint64_t occurred_at_ms = 0;
  uint64_t recorded_at_ms = 0;
  bool     shredded       = false;
};

} // namespace ledger::db::model
