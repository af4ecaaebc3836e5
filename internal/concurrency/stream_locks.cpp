#include "stream_locks.hpp"

#include <functional>

namespace ledger::concurrency {

std::unique_lock<std::mutex> StreamLocks::Lock(std::string_view key) {
  return std::unique_lock<std::mutex>(Shard(key));
}

std::string StreamLocks::Key(std::string_view projection, std::string_view stream_id) {
  std::string key;
  key.reserve(projection.size() + stream_id.size() + 1);
  key.append(projection);
  key.push_back('\0');
  key.append(stream_id);
  return key;
}

std::mutex& StreamLocks::Shard(std::string_view key) {
  return shards_[std::hash<std::string_view>{}(key) % kShardCount];
}

} // namespace ledger::concurrency
