#include "internal/snapshot/snapshot_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/account_aggregate.hpp"

namespace {

using ledger::db::memory::MemoryRepository;
using ledger::db::model::SnapshotRecord;
using ledger::journal::EventJournal;
using ledger::snapshot::SnapshotPolicy;
using ledger::snapshot::SnapshotStore;
using ledger::testing::Deposited;
using ledger::testing::Opened;

constexpr uint64_t kMinute = 60 * 1000;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo    = std::make_shared<MemoryRepository>();
  std::shared_ptr<EventJournal>     journal = std::make_shared<EventJournal>(repo);
};

SnapshotRecord SnapshotAt(uint64_t version, uint64_t taken_at_ms) {
  SnapshotRecord s;
  s.stream_id   = "acct-1";
  s.version     = version;
  s.taken_at_ms = taken_at_ms;
  return s;
}

void TestDefaultPolicy() {
  SnapshotPolicy policy;
  assert(policy.every_n_events == 1000);
  assert(policy.max_age == std::chrono::minutes(10));
  assert(!policy.retain_history);
}

void TestCountRule() {
  Fixture       f;
  SnapshotStore store(f.repo);

  // no snapshot yet: counted from version 0
  assert(!store.ShouldSnapshot(std::nullopt, 999, 0));
  assert(store.ShouldSnapshot(std::nullopt, 1000, 0));

  const uint64_t now    = 1'000'000;
  auto           latest = SnapshotAt(1000, now);
  assert(!store.ShouldSnapshot(latest, 1999, now));
  assert(store.ShouldSnapshot(latest, 2000, now));
}

void TestAgeRule() {
  Fixture       f;
  SnapshotStore store(f.repo);

  const uint64_t taken  = 5'000'000;
  auto           latest = SnapshotAt(10, taken);

  assert(!store.ShouldSnapshot(latest, 11, taken + 10 * kMinute - 1));
  assert(store.ShouldSnapshot(latest, 11, taken + 10 * kMinute));

  // old snapshot but nothing new to cover
  assert(!store.ShouldSnapshot(latest, 10, taken + 60 * kMinute));

  // the age rule alone never fires without a previous snapshot
  assert(!store.ShouldSnapshot(std::nullopt, 5, taken + 60 * kMinute));
}

void TestSaveAndLoadLatest() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(1), Deposited(2)});

  SnapshotStore store(f.repo);
  assert(!store.LoadLatest("acct-1").has_value());

  assert(store.Save("acct-1", 2, "state@2"));
  auto latest = store.LoadLatest("acct-1");
  assert(latest.has_value());
  assert(latest->version == 2);
  assert(latest->state == "state@2");
  assert(latest->taken_at_ms > 0);

  assert(store.Save("acct-1", 3, "state@3"));
  latest = store.LoadLatest("acct-1");
  assert(latest->version == 3);
  assert(latest->state == "state@3");
}

void TestSaveIsSupersedeOnly() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(1), Deposited(2)});

  SnapshotStore store(f.repo);
  assert(store.Save("acct-1", 3, "state@3"));

  // equal or older versions never overwrite
  assert(!store.Save("acct-1", 3, "other"));
  assert(!store.Save("acct-1", 2, "older"));
  assert(store.LoadLatest("acct-1")->state == "state@3");
}

void TestSaveRejectsImpossibleVersions() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice")});

  SnapshotStore store(f.repo);

  bool threw = false;
  try {
    store.Save("acct-1", 0, "zero");
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    store.Save("acct-1", 2, "future");
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(!store.LoadLatest("acct-1").has_value());
}

void TestRetainHistoryKeepsLatestVisible() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(1)});

  SnapshotPolicy policy;
  policy.retain_history = true;
  SnapshotStore store(f.repo, policy);

  assert(store.Save("acct-1", 1, "state@1"));
  assert(store.Save("acct-1", 2, "state@2"));
  assert(store.LoadLatest("acct-1")->version == 2);
}

} // namespace

int main() {
  TestDefaultPolicy();
  TestCountRule();
  TestAgeRule();
  TestSaveAndLoadLatest();
  TestSaveIsSupersedeOnly();
  TestSaveRejectsImpossibleVersions();
  TestRetainHistoryKeepsLatestVisible();

  std::cout << "event_ledger_unit_snapshot_store: pass\n";
  return 0;
}
