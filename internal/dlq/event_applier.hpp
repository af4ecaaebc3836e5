#pragma once

#include <string>

#include "internal/model/event.hpp"

namespace ledger::dlq {

/*
  The apply step redrive shares with normal consumption.

  ApplyQueued applies one event for one projection and advances its
  checkpoint in the same transaction. It must be idempotent for
  versions at or below the checkpoint and throws on failure. Callers
  already hold the (projection, stream) lock.
*/
class EventApplier {
 public:
  virtual ~EventApplier() = default;

  virtual void ApplyQueued(const std::string& projection, const model::Event& event) = 0;
};

} // namespace ledger::dlq
