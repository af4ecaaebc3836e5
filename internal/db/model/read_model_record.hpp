#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

struct ReadModelRecord {
  std::string projection;
  std::string key;
  std::string value;

  // version of the source event that produced this row
  uint64_t version       = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace ledger::db::model
