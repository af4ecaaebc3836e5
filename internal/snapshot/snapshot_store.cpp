#include "snapshot_store.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::snapshot {

using observability::StringField;
using observability::UintField;

SnapshotStore::SnapshotStore(std::shared_ptr<db::Repository> repository, SnapshotPolicy policy, util::RetryPolicy retry)
    : repository_(std::move(repository)), policy_(policy), retry_(retry) {
  if (!repository_) {
    throw util::InvalidArgument("snapshot store requires a repository");
  }
  if (policy_.every_n_events == 0) {
    policy_.every_n_events = 1000;
  }
}

bool SnapshotStore::Save(const std::string& stream_id, uint64_t version, std::string state) {
  return observability::ObserveOperation("snapshot.save", stream_id, [&] {
    if (version == 0) {
      throw util::InvalidArgument("snapshot version must be at least 1");
    }

    const bool written = util::WithStorageRetry(retry_, "snapshot.save", [&] {
      auto tx = repository_->Begin();

      auto     stream = repository_->GetStream(*tx, stream_id);
      uint64_t head   = stream ? stream->version : 0;
      if (version > head) {
        throw util::InvalidArgument("snapshot of " + stream_id + "@" + std::to_string(version) + " is beyond stream head " +
                                    std::to_string(head));
      }

      auto latest = repository_->GetLatestSnapshot(*tx, stream_id);
      if (latest && latest->version >= version) {
        return false;
      }

      db::model::SnapshotRecord record;
      record.stream_id   = stream_id;
      record.version     = version;
      record.state       = state;
      record.taken_at_ms = util::NowMillis();

      db::ThrowIfError(repository_->InsertSnapshot(*tx, record), "insert snapshot");
      if (!policy_.retain_history) {
        db::ThrowIfError(repository_->DeleteSnapshotsBefore(*tx, stream_id, version), "prune snapshots");
      }
      tx->Commit();
      return true;
    });

    if (written) {
      LEDGER_LOG_DEBUG("snapshot saved", {StringField("stream", stream_id), UintField("version", version)});
    }
    return written;
  });
}

std::optional<db::model::SnapshotRecord> SnapshotStore::LoadLatest(const std::string& stream_id) const {
  return util::WithStorageRetry(retry_, "snapshot.load", [&] {
    auto tx       = repository_->Begin();
    auto snapshot = repository_->GetLatestSnapshot(*tx, stream_id);
    tx->Commit();
    return snapshot;
  });
}

bool SnapshotStore::ShouldSnapshot(const std::optional<db::model::SnapshotRecord>& latest, uint64_t current_version,
                                   uint64_t now_ms) const {
  const uint64_t last_version = latest ? latest->version : 0;
  if (current_version <= last_version) {
    return false;
  }
  if (current_version - last_version >= policy_.every_n_events) {
    return true;
  }
  // the age rule needs a previous snapshot to measure from
  if (!latest) {
    return false;
  }
  const auto max_age_ms = static_cast<uint64_t>(policy_.max_age.count());
  return now_ms >= latest->taken_at_ms && now_ms - latest->taken_at_ms >= max_age_ms;
}

} // namespace ledger::snapshot
