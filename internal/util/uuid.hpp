#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ledger::util {

/*
  UUID helpers

  Event, correlation and causation ids are RFC4122 v4 UUIDs in
  canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewUUIDString();

} // namespace ledger::util
