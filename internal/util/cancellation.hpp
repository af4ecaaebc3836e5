#pragma once

#include <atomic>

namespace ledger::util {

/*
  Cooperative cancellation flag. Long-running loops poll it between
  units of work and never mid-unit.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace ledger::util
