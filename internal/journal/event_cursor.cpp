#include "event_cursor.hpp"

#include "event_journal.hpp"

namespace ledger::journal {

EventCursor::EventCursor(const EventJournal& journal, std::string stream_id, uint64_t from_version, uint64_t end_version)
    : journal_(&journal),
      stream_id_(std::move(stream_id)),
      from_version_(from_version == 0 ? 1 : from_version),
      end_version_(end_version),
      next_version_(from_version_) {
}

std::optional<model::Event> EventCursor::Next() {
  if (page_pos_ >= page_.size()) {
    if (exhausted_ || next_version_ > end_version_) {
      exhausted_ = true;
      return std::nullopt;
    }
    FetchPage();
    if (page_.empty()) {
      exhausted_ = true;
      return std::nullopt;
    }
  }

  model::Event event = std::move(page_[page_pos_++]);
  next_version_      = event.version + 1;
  return event;
}

void EventCursor::Reset() {
  page_.clear();
  page_pos_     = 0;
  next_version_ = from_version_;
  exhausted_    = false;
}

std::vector<model::Event> EventCursor::Collect() {
  std::vector<model::Event> out;
  while (auto event = Next()) {
    out.push_back(std::move(*event));
  }
  return out;
}

void EventCursor::FetchPage() {
  page_     = journal_->ReadPage(stream_id_, next_version_, end_version_, journal_->Options().read_batch_size);
  page_pos_ = 0;
}

} // namespace ledger::journal
