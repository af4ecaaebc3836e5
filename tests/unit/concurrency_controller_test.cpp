#include "internal/concurrency/concurrency_controller.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/aggregate/rehydrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/account_aggregate.hpp"

namespace {

using ledger::aggregate::Rehydrator;
using ledger::concurrency::ConcurrencyController;
using ledger::concurrency::ConcurrencyOptions;
using ledger::db::memory::MemoryRepository;
using ledger::journal::EventJournal;
using ledger::testing::Account;
using ledger::testing::AccountDefinition;
using ledger::testing::Deposited;
using ledger::testing::Opened;
using ledger::testing::Withdrawn;

using Controller = ConcurrencyController<Account>;

struct Fixture {
  std::shared_ptr<MemoryRepository>          repo    = std::make_shared<MemoryRepository>();
  std::shared_ptr<EventJournal>              journal = std::make_shared<EventJournal>(repo);
  std::shared_ptr<const Rehydrator<Account>> rehydrator =
      std::make_shared<Rehydrator<Account>>(journal, nullptr, std::make_shared<AccountDefinition>());

  std::shared_ptr<Controller> MakeController(ConcurrencyOptions options = {}) {
    return std::make_shared<Controller>(journal, rehydrator, options);
  }
};

void TestDefaultIsThreeAttempts() {
  ConcurrencyOptions options;
  assert(options.max_attempts == 3);
  assert(!options.serialize_per_stream);
}

void TestDecideSeesCurrentStateAndVersion() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice"), Deposited(50)});

  auto controller = f.MakeController();
  auto result     = controller->Execute("acct-1", [](const Account& a, uint64_t version) {
    assert(version == 2);
    assert(a.balance == 50);
    return Controller::Decision{Withdrawn(20)};
  });

  assert(result.first_version == 3);
  assert(result.committed_version == 3);
  assert(f.rehydrator->Rehydrate("acct-1").state.balance == 30);
}

void TestRetriesAfterConflict() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice")});

  auto controller = f.MakeController();
  int  calls      = 0;
  auto result     = controller->Execute("acct-1", [&](const Account& a, uint64_t version) {
    ++calls;
    if (calls == 1) {
      // a competing writer lands between rehydrate and append
      f.journal->Append("acct-1", version, {Deposited(7)});
    } else {
      assert(a.balance == 7);
    }
    return Controller::Decision{Deposited(1)};
  });

  assert(calls == 2);
  assert(result.committed_version == 3);
  assert(f.rehydrator->Rehydrate("acct-1").state.balance == 8);
}

void TestExhaustionAfterMaxAttempts() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice")});

  auto controller = f.MakeController();
  int  calls      = 0;

  bool threw = false;
  try {
    controller->Execute("acct-1", [&](const Account&, uint64_t version) {
      ++calls;
      f.journal->Append("acct-1", version, {Deposited(1)});
      return Controller::Decision{Deposited(100)};
    });
  } catch (const ledger::util::ConcurrencyExhausted& e) {
    threw = true;
    assert(e.Attempts() == 3);
  }
  assert(threw);
  assert(calls == 3);

  // none of the rejected deposits landed
  assert(f.rehydrator->Rehydrate("acct-1").state.balance == 3);
}

void TestEmptyDecisionAppendsNothing() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice")});

  auto controller = f.MakeController();
  auto result     = controller->Execute("acct-1", [](const Account&, uint64_t) { return Controller::Decision{}; });
  assert(result.events.empty());
  assert(result.first_version == 1);
  assert(result.committed_version == 1);
  assert(f.journal->StreamVersion("acct-1") == 1);
}

void TestDecideErrorsPropagateUnchanged() {
  Fixture f;
  f.journal->Append("acct-1", 0, {Opened("alice")});

  auto controller = f.MakeController();

  bool threw = false;
  try {
    controller->Execute("acct-1", [](const Account& a, uint64_t) -> Controller::Decision {
      if (a.balance < 10) throw std::domain_error("insufficient funds");
      return {Withdrawn(10)};
    });
  } catch (const std::domain_error& e) {
    threw = std::string(e.what()) == "insufficient funds";
  }
  assert(threw);
  assert(f.journal->StreamVersion("acct-1") == 1);
}

void TestConcurrentCommandsAllLand() {
  constexpr int kThreads  = 4;
  constexpr int kCommands = 5;

  for (bool serialize : {false, true}) {
    Fixture f;
    f.journal->Append("acct-1", 0, {Opened("alice")});

    ConcurrencyOptions options;
    options.serialize_per_stream = serialize;
    // every failed attempt means another command committed
    options.max_attempts = kThreads * kCommands;
    auto controller      = f.MakeController(options);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&] {
        for (int i = 0; i < kCommands; ++i) {
          controller->Execute("acct-1", [](const Account&, uint64_t) { return Controller::Decision{Deposited(1)}; });
        }
      });
    }
    for (auto& t : threads) t.join();

    auto account = f.rehydrator->Rehydrate("acct-1");
    assert(account.version == 1 + kThreads * kCommands);
    assert(account.state.balance == kThreads * kCommands);
  }
}

} // namespace

int main() {
  TestDefaultIsThreeAttempts();
  TestDecideSeesCurrentStateAndVersion();
  TestRetriesAfterConflict();
  TestExhaustionAfterMaxAttempts();
  TestEmptyDecisionAppendsNothing();
  TestDecideErrorsPropagateUnchanged();
  TestConcurrentCommandsAllLand();

  std::cout << "event_ledger_unit_concurrency_controller: pass\n";
  return 0;
}
