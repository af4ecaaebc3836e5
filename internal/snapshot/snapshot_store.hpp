#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/retry.hpp"

namespace ledger::snapshot {

struct SnapshotPolicy {
  uint64_t                  every_n_events = 1000;
  std::chrono::milliseconds max_age        = std::chrono::minutes(10);
  bool                      retain_history = false;
};

/*
  Snapshot persistence plus the N-events / T-age policy.

  Snapshots are superseded, never updated: a newer one is inserted
  and, unless history is retained, the older ones are deleted in the
  same transaction.
*/
class SnapshotStore {
 public:
  SnapshotStore(std::shared_ptr<db::Repository> repository, SnapshotPolicy policy = {}, util::RetryPolicy retry = {});

  // Returns false when a snapshot at or beyond `version` already exists.
  // Throws InvalidArgument when `version` is 0 or beyond the stream head.
  bool Save(const std::string& stream_id, uint64_t version, std::string state);

  std::optional<db::model::SnapshotRecord> LoadLatest(const std::string& stream_id) const;

  bool ShouldSnapshot(const std::optional<db::model::SnapshotRecord>& latest, uint64_t current_version, uint64_t now_ms) const;

  const SnapshotPolicy& Policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  SnapshotPolicy                  policy_;
  util::RetryPolicy               retry_;
};

} // namespace ledger::snapshot
