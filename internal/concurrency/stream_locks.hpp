#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace ledger::concurrency {

/*
  Sharded in-process lock table.

  Keys hash onto a fixed set of mutexes, so unrelated keys may share a
  shard. Never hold two locks from the same table at once.
*/
class StreamLocks {
 public:
  static constexpr std::size_t kShardCount = 64;

  std::unique_lock<std::mutex> Lock(std::string_view key);

  static std::string Key(std::string_view projection, std::string_view stream_id);

 private:
  std::mutex& Shard(std::string_view key);

  std::array<std::mutex, kShardCount> shards_;
};

} // namespace ledger::concurrency
