#pragma once

#include <string>

#include "internal/model/event.hpp"
#include "ledger/v1/envelope.pb.h"

namespace ledger::model {

/*
  Envelope codec.

  Converts committed events to the wire envelope and back. JSON uses
  the protobuf JSON mapping: camelCase keys, base64 payload and an
  RFC 3339 occurredAt. The uint64 version is written as a quoted
  decimal string ("version": "7"). FromJson accepts it quoted or as a
  bare number. recorded_at_ms and the shredded flag are journal-local
  and do not travel.
*/

ledger::v1::EventEnvelope ToEnvelope(const Event& event);
Event                     FromEnvelope(const ledger::v1::EventEnvelope& envelope);

std::string ToJson(const Event& event, bool pretty = false);

// Throws util::InvalidArgument on malformed JSON or unknown keys.
Event FromJson(const std::string& json);

} // namespace ledger::model
