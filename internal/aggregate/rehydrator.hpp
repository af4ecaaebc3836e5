#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/aggregate/aggregate.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/observability/logging.hpp"
#include "internal/snapshot/snapshot_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::aggregate {

template <typename State>
struct Rehydrated {
  State    state;
  uint64_t version          = 0;
  uint64_t snapshot_version = 0; // 0 when no snapshot was used
  uint64_t events_applied   = 0;
};

/*
  Rebuilds aggregate state: latest snapshot (or Initial() at version 0)
  folded with the events after it. Deterministic for a given journal.

  With snapshot_on_rehydrate, a snapshot is written when the store's
  policy says so. Snapshot problems never fail a rehydrate: a snapshot
  that cannot be decoded falls back to a full replay and a failed save
  is only logged.
*/
template <typename State>
class Rehydrator {
 public:
  Rehydrator(std::shared_ptr<journal::EventJournal> journal, std::shared_ptr<snapshot::SnapshotStore> snapshots,
             std::shared_ptr<const AggregateDefinition<State>> definition, bool snapshot_on_rehydrate = true)
      : journal_(std::move(journal)),
        snapshots_(std::move(snapshots)),
        definition_(std::move(definition)),
        snapshot_on_rehydrate_(snapshot_on_rehydrate) {
    if (!journal_ || !definition_) {
      throw util::InvalidArgument("rehydrator requires a journal and an aggregate definition");
    }
  }

  Rehydrated<State> Rehydrate(const std::string& stream_id) const {
    std::optional<db::model::SnapshotRecord> latest;
    if (snapshots_) {
      latest = snapshots_->LoadLatest(stream_id);
    }

    Rehydrated<State> out{definition_->Initial(), 0, 0, 0};
    if (latest) {
      try {
        out.state            = definition_->Decode(latest->state);
        out.version          = latest->version;
        out.snapshot_version = latest->version;
      } catch (const std::exception& e) {
        LEDGER_LOG_WARN("snapshot decode failed; replaying from scratch",
                        {observability::StringField("stream", stream_id), observability::UintField("snapshot_version", latest->version),
                         observability::StringField("error", e.what())});
        out = Rehydrated<State>{definition_->Initial(), 0, 0, 0};
      }
    }

    Fold(stream_id, out);

    if (snapshot_on_rehydrate_ && snapshots_ && snapshots_->ShouldSnapshot(latest, out.version, util::NowMillis())) {
      try {
        snapshots_->Save(stream_id, out.version, definition_->Encode(out.state));
      } catch (const util::StorageFailure& e) {
        LEDGER_LOG_WARN("snapshot save failed", {observability::StringField("stream", stream_id),
                                                 observability::UintField("version", out.version),
                                                 observability::StringField("error", e.what())});
      }
    }
    return out;
  }

  // Ignores snapshots entirely.
  Rehydrated<State> RehydrateFromScratch(const std::string& stream_id) const {
    Rehydrated<State> out{definition_->Initial(), 0, 0, 0};
    Fold(stream_id, out);
    return out;
  }

  const AggregateDefinition<State>& Definition() const {
    return *definition_;
  }

 private:
  void Fold(const std::string& stream_id, Rehydrated<State>& out) const {
    auto cursor = journal_->Read(stream_id, out.version + 1);
    while (auto event = cursor.Next()) {
      if (event->version != out.version + 1) {
        throw util::InvalidState("journal gap in " + stream_id + ": expected version " + std::to_string(out.version + 1) + ", got " +
                                 std::to_string(event->version));
      }
      out.state   = definition_->Apply(std::move(out.state), *event);
      out.version = event->version;
      ++out.events_applied;
    }
  }

  std::shared_ptr<journal::EventJournal>            journal_;
  std::shared_ptr<snapshot::SnapshotStore>          snapshots_;
  std::shared_ptr<const AggregateDefinition<State>> definition_;
  bool                                              snapshot_on_rehydrate_;
};

} // namespace ledger::aggregate
