#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/aggregate/rehydrator.hpp"
#include "internal/concurrency/stream_locks.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::concurrency {

struct ConcurrencyOptions {
  // total attempts, including the first
  uint32_t max_attempts         = 3;
  bool     serialize_per_stream = false;
};

/*
  Optimistic command execution.

  Each attempt rehydrates, asks `decide` for new events given the
  state and its version, and appends with that version as the
  expectation. A VersionConflict starts the next attempt from a fresh
  rehydrate; after max_attempts conflicts ConcurrencyExhausted is
  thrown. Anything thrown by `decide` propagates unchanged.
*/
template <typename State>
class ConcurrencyController {
 public:
  using Decision = std::vector<model::NewEvent>;
  using DecideFn = std::function<Decision(const State& state, uint64_t version)>;

  ConcurrencyController(std::shared_ptr<journal::EventJournal> journal, std::shared_ptr<const aggregate::Rehydrator<State>> rehydrator,
                        ConcurrencyOptions options = {}, std::shared_ptr<StreamLocks> locks = nullptr)
      : journal_(std::move(journal)), rehydrator_(std::move(rehydrator)), options_(options), locks_(std::move(locks)) {
    if (!journal_ || !rehydrator_) {
      throw util::InvalidArgument("concurrency controller requires a journal and a rehydrator");
    }
    if (options_.max_attempts == 0) {
      options_.max_attempts = 3;
    }
    if (options_.serialize_per_stream && !locks_) {
      locks_ = std::make_shared<StreamLocks>();
    }
  }

  journal::AppendResult Execute(const std::string& stream_id, const DecideFn& decide) const {
    std::unique_lock<std::mutex> hot_stream;
    if (options_.serialize_per_stream) {
      hot_stream = locks_->Lock(stream_id);
    }

    for (uint32_t attempt = 1;; ++attempt) {
      auto     current  = rehydrator_->Rehydrate(stream_id);
      Decision decision = decide(current.state, current.version);

      if (decision.empty()) {
        journal::AppendResult none;
        none.stream_id         = stream_id;
        none.first_version     = current.version;
        none.committed_version = current.version;
        return none;
      }

      try {
        return journal_->Append(stream_id, current.version, std::move(decision));
      } catch (const util::VersionConflict& e) {
        if (attempt >= options_.max_attempts) {
          LEDGER_LOG_WARN("command retries exhausted",
                          {observability::StringField("stream", stream_id), observability::UintField("attempts", attempt)});
          throw util::ConcurrencyExhausted(stream_id, attempt);
        }
        LEDGER_LOG_DEBUG("command conflicted; retrying",
                         {observability::StringField("stream", stream_id), observability::UintField("attempt", attempt),
                          observability::UintField("actual_version", e.Actual())});
      }
    }
  }

  const ConcurrencyOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<journal::EventJournal>              journal_;
  std::shared_ptr<const aggregate::Rehydrator<State>> rehydrator_;
  ConcurrencyOptions                                  options_;
  std::shared_ptr<StreamLocks>                        locks_;
};

} // namespace ledger::concurrency
