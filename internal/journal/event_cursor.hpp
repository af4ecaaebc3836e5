#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/event.hpp"

namespace ledger::journal {

class EventJournal;

/*
  Lazy, finite, restartable pull cursor over one stream.

  The end bound is fixed when the cursor is created: events appended
  afterwards are not yielded. Events are fetched from the journal in
  pages. The journal must outlive the cursor.
*/
class EventCursor {
 public:
  EventCursor(const EventJournal& journal, std::string stream_id, uint64_t from_version, uint64_t end_version);

  std::optional<model::Event> Next();

  // Rewind to the first version; the end bound does not move.
  void Reset();

  const std::string& StreamId() const {
    return stream_id_;
  }
  uint64_t FromVersion() const {
    return from_version_;
  }
  uint64_t EndVersion() const {
    return end_version_;
  }

  // Drains the remaining events.
  std::vector<model::Event> Collect();

 private:
  void FetchPage();

  const EventJournal*       journal_;
  std::string               stream_id_;
  uint64_t                  from_version_;
  uint64_t                  end_version_;
  uint64_t                  next_version_;
  std::vector<model::Event> page_;
  size_t                    page_pos_  = 0;
  bool                      exhausted_ = false;
};

} // namespace ledger::journal
