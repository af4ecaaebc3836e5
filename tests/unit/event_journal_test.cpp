#include "internal/journal/event_journal.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/account_aggregate.hpp"

namespace {

using ledger::db::memory::MemoryRepository;
using ledger::journal::AppendResult;
using ledger::journal::EventJournal;
using ledger::model::MakeEvent;
using ledger::model::NewEvent;
using ledger::testing::Deposited;
using ledger::testing::Opened;

std::shared_ptr<EventJournal> MakeJournal() {
  return std::make_shared<EventJournal>(std::make_shared<MemoryRepository>());
}

void TestAppendAssignsContiguousVersions() {
  auto journal = MakeJournal();

  auto first = journal->Append("acct-1", 0, {Opened("alice"), Deposited(10)});
  assert(first.first_version == 1);
  assert(first.committed_version == 2);
  assert(first.events.size() == 2);
  assert(first.events[0].version == 1);
  assert(first.events[1].version == 2);
  assert(first.events[0].stream_id == "acct-1");
  assert(!first.events[0].event_id.empty());
  assert(first.events[0].occurred_at_ms > 0);
  assert(first.events[0].recorded_at_ms > 0);

  auto second = journal->Append("acct-1", 2, {Deposited(5)});
  assert(second.first_version == 3);
  assert(second.committed_version == 3);
  assert(journal->StreamVersion("acct-1") == 3);
  assert(journal->StreamVersion("acct-unknown") == 0);
}

void TestStaleExpectedVersionThrowsConflict() {
  auto journal = MakeJournal();
  journal->Append("acct-1", 0, {Opened("alice")});

  bool threw = false;
  try {
    journal->Append("acct-1", 0, {Deposited(1)});
  } catch (const ledger::util::VersionConflict& e) {
    threw = true;
    assert(e.StreamId() == "acct-1");
    assert(e.Expected() == 0);
    assert(e.Actual() == 1);
  }
  assert(threw);
  assert(journal->StreamVersion("acct-1") == 1);

  // nothing of the rejected batch is visible
  assert(journal->Read("acct-1").Collect().size() == 1);
}

void TestRejectsInvalidBatches() {
  auto journal = MakeJournal();

  bool threw = false;
  try {
    journal->Append("", 0, {Opened("alice")});
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    journal->Append("acct-1", 0, {});
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    journal->Append("acct-1", 0, {MakeEvent("", "x")});
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(journal->StreamVersion("acct-1") == 0);
}

void TestDuplicateEventIdRejectsWholeBatch() {
  auto journal = MakeJournal();

  NewEvent opened = Opened("alice");
  opened.event_id = "evt-fixed";
  journal->Append("acct-1", 0, {opened});

  NewEvent again = Deposited(1);
  again.event_id = "evt-fixed";

  bool threw = false;
  try {
    journal->Append("acct-2", 0, {Deposited(2), again});
  } catch (const ledger::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(journal->StreamVersion("acct-2") == 0);
}

void TestReadHonoursRange() {
  auto journal = MakeJournal();
  journal->Append("acct-1", 0, {Opened("alice"), Deposited(1), Deposited(2), Deposited(3), Deposited(4)});

  auto middle = journal->Read("acct-1", 2, 4).Collect();
  assert(middle.size() == 3);
  assert(middle.front().version == 2);
  assert(middle.back().version == 4);

  auto tail = journal->Read("acct-1", 4).Collect();
  assert(tail.size() == 2);
  assert(tail.back().version == 5);

  assert(journal->Read("acct-1", 9).Collect().empty());
  assert(journal->Read("acct-missing").Collect().empty());
}

void TestMetadataRoundTrips() {
  auto journal = MakeJournal();

  NewEvent e       = Deposited(7);
  e.event_id       = "evt-meta";
  e.correlation_id = "corr-1";
  e.causation_id   = "cause-1";
  e.occurred_at_ms = 1234;
  journal->Append("acct-1", 0, {e});

  auto found = journal->FindEvent("evt-meta");
  assert(found.has_value());
  assert(found->stream_id == "acct-1");
  assert(found->version == 1);
  assert(found->type == "Deposited");
  assert(found->payload == "7");
  assert(found->correlation_id == "corr-1");
  assert(found->causation_id == "cause-1");
  assert(found->occurred_at_ms == 1234);
  assert(!journal->FindEvent("evt-none").has_value());
}

void TestShredClearsPayloadOnly() {
  auto journal = MakeJournal();

  NewEvent e = Opened("alice");
  e.event_id = "evt-pii";
  journal->Append("acct-1", 0, {e, Deposited(3)});

  journal->ShredPayload("evt-pii");

  auto events = journal->Read("acct-1").Collect();
  assert(events.size() == 2);
  assert(events[0].shredded);
  assert(events[0].payload.empty());
  assert(events[0].type == "AccountOpened");
  assert(events[0].version == 1);
  assert(!events[1].shredded);
  assert(events[1].payload == "3");

  bool threw = false;
  try {
    journal->ShredPayload("evt-none");
  } catch (const ledger::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestObserverSeesCommittedBatch() {
  auto journal = MakeJournal();

  std::vector<AppendResult> seen;
  journal->SetAppendObserver([&](const AppendResult& r) { seen.push_back(r); });

  journal->Append("acct-1", 0, {Opened("alice"), Deposited(1)});
  try {
    journal->Append("acct-1", 0, {Deposited(1)});
  } catch (const ledger::util::VersionConflict&) {
  }

  assert(seen.size() == 1);
  assert(seen[0].committed_version == 2);

  // an observer failure never undoes the append
  journal->SetAppendObserver([](const AppendResult&) { throw std::runtime_error("boom"); });
  auto r = journal->Append("acct-1", 2, {Deposited(2)});
  assert(r.committed_version == 3);
  assert(journal->StreamVersion("acct-1") == 3);
}

void TestConcurrentAppendsExactlyOneWins() {
  auto journal = MakeJournal();
  journal->Append("acct-1", 0, {Opened("alice")});

  constexpr int            kThreads = 8;
  std::atomic<int>         winners{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      try {
        journal->Append("acct-1", 1, {Deposited(1)});
        ++winners;
      } catch (const ledger::util::VersionConflict&) {
        ++conflicts;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(winners == 1);
  assert(conflicts == kThreads - 1);
  assert(journal->StreamVersion("acct-1") == 2);
}

void TestListStreams() {
  auto journal = MakeJournal();
  journal->Append("acct-a", 0, {Opened("a")});
  journal->Append("acct-b", 0, {Opened("b"), Deposited(1)});

  auto streams = journal->ListStreams();
  assert(streams.size() == 2);
  uint64_t total = 0;
  for (const auto& s : streams) total += s.version;
  assert(total == 3);
}

} // namespace

int main() {
  TestAppendAssignsContiguousVersions();
  TestStaleExpectedVersionThrowsConflict();
  TestRejectsInvalidBatches();
  TestDuplicateEventIdRejectsWholeBatch();
  TestReadHonoursRange();
  TestMetadataRoundTrips();
  TestShredClearsPayloadOnly();
  TestObserverSeesCommittedBatch();
  TestConcurrentAppendsExactlyOneWins();
  TestListStreams();

  std::cout << "event_ledger_unit_event_journal: pass\n";
  return 0;
}
