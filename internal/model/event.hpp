#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/event_record.hpp"

namespace ledger::model {

// Committed event as handed to aggregates and projections.
using Event = db::model::EventRecord;

/*
  Event proposed for append. The journal assigns stream id and
  version; an empty event_id gets a fresh UUID and a zero
  occurred_at_ms is stamped with the append time.
*/
struct NewEvent {
  std::string event_id;
  std::string type;
  std::string payload;
  std::string correlation_id;
  std::string causation_id;
  uint64_t    occurred_at_ms = 0;
};

inline NewEvent MakeEvent(std::string type, std::string payload) {
  NewEvent e;
  e.type    = std::move(type);
  e.payload = std::move(payload);
  return e;
}

} // namespace ledger::model
