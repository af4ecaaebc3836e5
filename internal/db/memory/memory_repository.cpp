#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace ledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Streams + journal
// ------------------------------------------------------------------

std::optional<model::StreamRecord> MemoryRepository::GetStream(Transaction& t, const std::string& stream_id) {
  const auto& s  = TX(t).View();
  auto        it = s.streams.find(stream_id);
  if (it == s.streams.end()) return std::nullopt;
  return it->second;
}

std::vector<model::StreamRecord> MemoryRepository::ListStreams(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::StreamRecord> records;
  records.reserve(s.streams.size());
  for (const auto& [_, record] : s.streams) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.stream_id < b.stream_id; });
  return records;
}

Result MemoryRepository::AppendEvents(Transaction& t, const std::string& stream_id, uint64_t expected_version,
                                      std::vector<model::EventRecord>& events) {
  {
    const auto& view    = TX(t).View();
    auto        it      = view.streams.find(stream_id);
    uint64_t    current = it == view.streams.end() ? 0 : it->second.version;
    if (current != expected_version) {
      return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " is at version " + std::to_string(current) + ", expected " +
                                                  std::to_string(expected_version));
    }

    std::unordered_set<std::string> batch_ids;
    for (const auto& e : events) {
      if (view.event_index.contains(e.event_id) || !batch_ids.insert(e.event_id).second) {
        return Result::Err(ErrorCode::AlreadyExists, "duplicate event id " + e.event_id);
      }
    }
  }

  auto&          s   = TX(t).Mutable();
  const uint64_t now = util::NowMillis();

  auto& stream = s.streams[stream_id];
  if (stream.stream_id.empty()) {
    stream.stream_id     = stream_id;
    stream.created_at_ms = now;
  }

  auto& log = s.events[stream_id];
  for (auto& e : events) {
    e.stream_id = stream_id;
    e.version   = ++stream.version;
    if (e.recorded_at_ms == 0) e.recorded_at_ms = now;
    s.event_index[e.event_id] = EventLocation{stream_id, e.version};
    log.push_back(e);
  }
  stream.updated_at_ms = now;
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, const std::string& stream_id, uint64_t from_version,
                                                             uint64_t to_version, std::optional<uint64_t> max_count) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;

  auto it = s.events.find(stream_id);
  if (it == s.events.end()) return out;

  const auto& log   = it->second;
  uint64_t    first = std::max<uint64_t>(from_version, 1);
  uint64_t    last  = std::min<uint64_t>(to_version, log.size());
  for (uint64_t v = first; v <= last; ++v) {
    if (max_count && out.size() >= *max_count) break;
    out.push_back(log[v - 1]);
  }
  return out;
}

std::optional<model::EventRecord> MemoryRepository::GetEventById(Transaction& t, const std::string& event_id) {
  const auto& s  = TX(t).View();
  auto        it = s.event_index.find(event_id);
  if (it == s.event_index.end()) return std::nullopt;
  return s.events.at(it->second.stream_id).at(it->second.version - 1);
}

Result MemoryRepository::ShredEventPayload(Transaction& t, const std::string& event_id) {
  if (!TX(t).View().event_index.contains(event_id)) {
    return Result::Err(ErrorCode::NotFound, "event " + event_id);
  }
  auto& s     = TX(t).Mutable();
  auto& loc   = s.event_index.at(event_id);
  auto& event = s.events.at(loc.stream_id).at(loc.version - 1);
  event.payload.clear();
  event.shredded = true;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  auto& list = TX(t).Mutable().snapshots[r.stream_id];
  auto  pos  = std::lower_bound(list.begin(), list.end(), r.version,
                                [](const model::SnapshotRecord& existing, uint64_t v) { return existing.version < v; });
  if (pos != list.end() && pos->version == r.version) {
    return Result::Err(ErrorCode::AlreadyExists, "snapshot " + r.stream_id + "@" + std::to_string(r.version));
  }
  list.insert(pos, r);
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetLatestSnapshot(Transaction& t, const std::string& stream_id) {
  const auto& s  = TX(t).View();
  auto        it = s.snapshots.find(stream_id);
  if (it == s.snapshots.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

Result MemoryRepository::DeleteSnapshotsBefore(Transaction& t, const std::string& stream_id, uint64_t version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.snapshots.find(stream_id);
  if (it == s.snapshots.end()) return Result::Ok();
  std::erase_if(it->second, [version](const model::SnapshotRecord& r) { return r.version < version; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Checkpoints + read models
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  TX(t).Mutable().checkpoints[{r.projection, r.stream_id}] = r;
  return Result::Ok();
}

std::optional<model::CheckpointRecord> MemoryRepository::GetCheckpoint(Transaction& t, const std::string& projection,
                                                                       const std::string& stream_id) {
  const auto& s  = TX(t).View();
  auto        it = s.checkpoints.find({projection, stream_id});
  if (it == s.checkpoints.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CheckpointRecord> MemoryRepository::ListCheckpoints(Transaction& t, const std::string& projection) {
  const auto&                          s = TX(t).View();
  std::vector<model::CheckpointRecord> out;
  for (auto it = s.checkpoints.lower_bound({projection, ""}); it != s.checkpoints.end() && it->first.first == projection; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::DeleteCheckpoints(Transaction& t, const std::string& projection) {
  std::erase_if(TX(t).Mutable().checkpoints, [&](const auto& kv) { return kv.first.first == projection; });
  return Result::Ok();
}

Result MemoryRepository::UpsertReadModel(Transaction& t, const model::ReadModelRecord& r) {
  TX(t).Mutable().read_models[{r.projection, r.key}] = r;
  return Result::Ok();
}

std::optional<model::ReadModelRecord> MemoryRepository::GetReadModel(Transaction& t, const std::string& projection,
                                                                     const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.read_models.find({projection, key});
  if (it == s.read_models.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteReadModel(Transaction& t, const std::string& projection, const std::string& key) {
  TX(t).Mutable().read_models.erase({projection, key});
  return Result::Ok();
}

Result MemoryRepository::DeleteReadModels(Transaction& t, const std::string& projection) {
  std::erase_if(TX(t).Mutable().read_models, [&](const auto& kv) { return kv.first.first == projection; });
  return Result::Ok();
}

Result MemoryRepository::UpsertProjectionAlias(Transaction& t, const std::string& alias, const std::string& projection) {
  TX(t).Mutable().aliases[alias] = projection;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetProjectionAlias(Transaction& t, const std::string& alias) {
  const auto& s  = TX(t).View();
  auto        it = s.aliases.find(alias);
  if (it == s.aliases.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Dead-letter queue
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDlqEntry(Transaction& t, const model::DlqEntryRecord& r) {
  TX(t).Mutable().dlq[{r.projection, r.stream_id}] = r;
  return Result::Ok();
}

std::optional<model::DlqEntryRecord> MemoryRepository::GetDlqEntry(Transaction& t, const std::string& projection,
                                                                   const std::string& stream_id) {
  const auto& s  = TX(t).View();
  auto        it = s.dlq.find({projection, stream_id});
  if (it == s.dlq.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DlqEntryRecord> MemoryRepository::ListDlqEntries(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::DlqEntryRecord> out;
  out.reserve(s.dlq.size());
  for (const auto& [_, entry] : s.dlq) {
    out.push_back(entry);
  }
  return out;
}

Result MemoryRepository::DeleteDlqEntry(Transaction& t, const std::string& projection, const std::string& stream_id) {
  TX(t).Mutable().dlq.erase({projection, stream_id});
  return Result::Ok();
}

Result MemoryRepository::DeleteDlqEntries(Transaction& t, const std::string& projection) {
  std::erase_if(TX(t).Mutable().dlq, [&](const auto& kv) { return kv.first.first == projection; });
  return Result::Ok();
}

} // namespace ledger::db::memory
