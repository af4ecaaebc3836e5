#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ledger::dlq {

/*
  In-memory index of quarantined (projection, stream) pairs.

  Answers "is this stream quarantined for this projection?" on the hot
  consume path without a storage round-trip. Storage is the source of
  truth; the set is rebuilt from it on startup.
*/
class QuarantineSet {
 public:
  bool Contains(const std::string& projection, const std::string& stream_id) const;

  // true when the pair was not present before
  bool Insert(const std::string& projection, const std::string& stream_id);
  bool Erase(const std::string& projection, const std::string& stream_id);

  void EraseProjection(const std::string& projection);
  void Clear();

  std::size_t Size() const;
  std::size_t CountFor(const std::string& projection) const;

  std::vector<std::pair<std::string, std::string>> Keys() const;

 private:
  mutable std::mutex                                               mutex_;
  std::unordered_map<std::string, std::unordered_set<std::string>> by_projection_;
  std::size_t                                                      size_ = 0;
};

} // namespace ledger::dlq
