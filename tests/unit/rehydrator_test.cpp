#include "internal/aggregate/rehydrator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/snapshot/snapshot_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/account_aggregate.hpp"

namespace {

using ledger::aggregate::Rehydrator;
using ledger::db::memory::MemoryRepository;
using ledger::journal::EventJournal;
using ledger::model::MakeEvent;
using ledger::snapshot::SnapshotPolicy;
using ledger::snapshot::SnapshotStore;
using ledger::testing::Account;
using ledger::testing::AccountDefinition;
using ledger::testing::Deposited;
using ledger::testing::Opened;
using ledger::testing::Withdrawn;

struct Fixture {
  explicit Fixture(uint64_t every_n = 1000) {
    SnapshotPolicy policy;
    policy.every_n_events = every_n;
    snapshots             = std::make_shared<SnapshotStore>(repo, policy);
  }

  std::shared_ptr<MemoryRepository>        repo       = std::make_shared<MemoryRepository>();
  std::shared_ptr<EventJournal>            journal    = std::make_shared<EventJournal>(repo);
  std::shared_ptr<SnapshotStore>           snapshots;
  std::shared_ptr<const AccountDefinition> definition = std::make_shared<AccountDefinition>();
};

void TestEmptyStreamIsInitialState() {
  Fixture             f;
  Rehydrator<Account> rehydrator(f.journal, f.snapshots, f.definition);

  auto out = rehydrator.Rehydrate("acct-new");
  assert(out.version == 0);
  assert(out.events_applied == 0);
  assert(!out.state.open);
  assert(out.state.balance == 0);
}

void TestFoldsEveryEventInOrder() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(100), Withdrawn(30), Deposited(5)});

  Rehydrator<Account> rehydrator(f.journal, f.snapshots, f.definition);
  auto                out = rehydrator.Rehydrate("acct-1");
  assert(out.version == 4);
  assert(out.snapshot_version == 0);
  assert(out.events_applied == 4);
  assert(out.state.open);
  assert(out.state.owner == "alice");
  assert(out.state.balance == 75);
}

void TestSnapshotPlusTailEqualsFullReplay() {
  Fixture f(3);
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(10), Deposited(20), Deposited(30)});

  Rehydrator<Account> rehydrator(f.journal, f.snapshots, f.definition);

  // crosses the count threshold, so this rehydrate leaves a snapshot
  auto first = rehydrator.Rehydrate("acct-1");
  assert(first.state.balance == 60);
  auto snapshot = f.snapshots->LoadLatest("acct-1");
  assert(snapshot.has_value());
  assert(snapshot->version == 4);

  f.journal->Append("acct-1", 4, {Withdrawn(15), Deposited(1)});

  auto fast = rehydrator.Rehydrate("acct-1");
  assert(fast.snapshot_version == 4);
  assert(fast.events_applied == 2);
  assert(fast.version == 6);

  auto slow = rehydrator.RehydrateFromScratch("acct-1");
  assert(slow.events_applied == 6);
  assert(slow.version == fast.version);
  assert(slow.state.balance == fast.state.balance);
  assert(slow.state.owner == fast.state.owner);
  assert(slow.state.applied == fast.state.applied);
}

void TestNoSnapshotWrittenWhenDisabled() {
  Fixture f(1);
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(1)});

  Rehydrator<Account> rehydrator(f.journal, f.snapshots, f.definition, false);
  rehydrator.Rehydrate("acct-1");
  assert(!f.snapshots->LoadLatest("acct-1").has_value());
}

void TestWorksWithoutSnapshotStore() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(9)});

  Rehydrator<Account> rehydrator(f.journal, nullptr, f.definition);
  auto                out = rehydrator.Rehydrate("acct-1");
  assert(out.version == 2);
  assert(out.state.balance == 9);
}

void TestCorruptSnapshotFallsBackToReplay() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(40), Deposited(2)});
  assert(f.snapshots->Save("acct-1", 2, "not an account"));

  Rehydrator<Account> rehydrator(f.journal, f.snapshots, f.definition, false);
  auto                out = rehydrator.Rehydrate("acct-1");
  assert(out.snapshot_version == 0);
  assert(out.events_applied == 3);
  assert(out.state.balance == 42);
}

void TestUnknownEventTypeIsAnError() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), MakeEvent("Frozen", "")});

  Rehydrator<Account> rehydrator(f.journal, f.snapshots, f.definition);

  bool threw = false;
  try {
    rehydrator.Rehydrate("acct-1");
  } catch (const ledger::util::UnknownEventType&) {
    threw = true;
  }
  assert(threw);
}

void TestRequiresJournalAndDefinition() {
  Fixture f;

  bool threw = false;
  try {
    Rehydrator<Account> rehydrator(nullptr, f.snapshots, f.definition);
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

// Counter aggregate that decodes events into a closed variant; a new
// event type fails to compile in Apply instead of at runtime.
struct Incremented {
  int64_t by = 0;
};
struct Cleared {};
using CounterEvent = std::variant<Incremented, Cleared>;

class CounterDefinition final : public ledger::aggregate::AggregateDefinition<int64_t> {
 public:
  int64_t Initial() const override {
    return 0;
  }

  int64_t Apply(int64_t state, const ledger::model::Event& event) const override {
    return std::visit(
        [state](const auto& e) -> int64_t {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, Incremented>) {
            return state + e.by;
          } else {
            static_assert(std::is_same_v<T, Cleared>);
            return 0;
          }
        },
        Parse(event));
  }

  std::string Encode(const int64_t& state) const override {
    return std::to_string(state);
  }
  int64_t Decode(const std::string& bytes) const override {
    return std::stoll(bytes);
  }

 private:
  static CounterEvent Parse(const ledger::model::Event& event) {
    if (event.type == "Incremented") return Incremented{std::stoll(event.payload)};
    if (event.type == "Cleared") return Cleared{};
    throw ledger::util::UnknownEventType(event.type);
  }
};

void TestVariantDispatchedAggregate() {
  Fixture f(2);
  f.journal->Append("counter-1", 0,
                    {MakeEvent("Incremented", "4"), MakeEvent("Cleared", ""), MakeEvent("Incremented", "7"), MakeEvent("Incremented", "1")});

  Rehydrator<int64_t> rehydrator(f.journal, f.snapshots, std::make_shared<CounterDefinition>());
  auto                out = rehydrator.Rehydrate("counter-1");
  assert(out.version == 4);
  assert(out.state == 8);
  assert(rehydrator.RehydrateFromScratch("counter-1").state == out.state);
  assert(rehydrator.Rehydrate("counter-1").snapshot_version == 4);
}

} // namespace

int main() {
  TestEmptyStreamIsInitialState();
  TestFoldsEveryEventInOrder();
  TestSnapshotPlusTailEqualsFullReplay();
  TestNoSnapshotWrittenWhenDisabled();
  TestWorksWithoutSnapshotStore();
  TestCorruptSnapshotFallsBackToReplay();
  TestUnknownEventTypeIsAnError();
  TestRequiresJournalAndDefinition();
  TestVariantDispatchedAggregate();

  std::cout << "event_ledger_unit_rehydrator: pass\n";
  return 0;
}
