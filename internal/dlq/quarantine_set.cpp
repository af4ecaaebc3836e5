#include "quarantine_set.hpp"

namespace ledger::dlq {

bool QuarantineSet::Contains(const std::string& projection, const std::string& stream_id) const {
  std::lock_guard lock(mutex_);
  auto            it = by_projection_.find(projection);
  return it != by_projection_.end() && it->second.contains(stream_id);
}

bool QuarantineSet::Insert(const std::string& projection, const std::string& stream_id) {
  std::lock_guard lock(mutex_);
  bool            inserted = by_projection_[projection].insert(stream_id).second;
  if (inserted) ++size_;
  return inserted;
}

bool QuarantineSet::Erase(const std::string& projection, const std::string& stream_id) {
  std::lock_guard lock(mutex_);
  auto            it = by_projection_.find(projection);
  if (it == by_projection_.end() || it->second.erase(stream_id) == 0) return false;
  if (it->second.empty()) by_projection_.erase(it);
  --size_;
  return true;
}

void QuarantineSet::EraseProjection(const std::string& projection) {
  std::lock_guard lock(mutex_);
  auto            it = by_projection_.find(projection);
  if (it == by_projection_.end()) return;
  size_ -= it->second.size();
  by_projection_.erase(it);
}

void QuarantineSet::Clear() {
  std::lock_guard lock(mutex_);
  by_projection_.clear();
  size_ = 0;
}

std::size_t QuarantineSet::Size() const {
  std::lock_guard lock(mutex_);
  return size_;
}

std::size_t QuarantineSet::CountFor(const std::string& projection) const {
  std::lock_guard lock(mutex_);
  auto            it = by_projection_.find(projection);
  return it == by_projection_.end() ? 0 : it->second.size();
}

std::vector<std::pair<std::string, std::string>> QuarantineSet::Keys() const {
  std::lock_guard                                  lock(mutex_);
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(size_);
  for (const auto& [projection, streams] : by_projection_) {
    for (const auto& stream_id : streams) {
      out.emplace_back(projection, stream_id);
    }
  }
  return out;
}

} // namespace ledger::dlq
