#include "internal/projection/projection_runner.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/aggregate/rehydrator.hpp"
#include "internal/concurrency/concurrency_controller.hpp"
#include "internal/concurrency/stream_locks.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dlq/sequence_dlq.hpp"
#include "internal/journal/event_journal.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/account_aggregate.hpp"

namespace {

using ledger::aggregate::Rehydrator;
using ledger::concurrency::ConcurrencyController;
using ledger::concurrency::ConcurrencyOptions;
using ledger::concurrency::StreamLocks;
using ledger::db::memory::MemoryRepository;
using ledger::dlq::RedriveOutcome;
using ledger::dlq::SequenceDeadLetterQueue;
using ledger::journal::AppendResult;
using ledger::journal::EventJournal;
using ledger::model::Event;
using ledger::model::NewEvent;
using ledger::projection::ConsumeOutcome;
using ledger::projection::ProjectionRunner;
using ledger::projection::ReadModelWriter;
using ledger::testing::Account;
using ledger::testing::AccountDefinition;
using ledger::testing::BalanceProjection;
using ledger::testing::Deposited;
using ledger::testing::Withdrawn;

constexpr const char* kBalances = "balances";

// Balance projection that throws on chosen (stream, version) pairs.
struct FaultyBalances {
  std::set<std::pair<std::string, uint64_t>> faults;

  ProjectionRunner::ApplyFn Fn() {
    return [this](ReadModelWriter& writer, const Event& event) {
      if (faults.contains({event.stream_id, event.version})) {
        throw ledger::util::ProjectionApplyFailure("simulated fault");
      }
      BalanceProjection(writer, event);
    };
  }
};

struct Fixture {
  explicit Fixture(bool dispatch = true) {
    if (dispatch) {
      journal->SetAppendObserver([this](const AppendResult& appended) { runner->Consume(appended); });
    }
  }

  ~Fixture() {
    journal->SetAppendObserver(nullptr);
  }

  AppendResult Append(const std::string& stream, std::vector<NewEvent> events) {
    return journal->Append(stream, journal->StreamVersion(stream), std::move(events));
  }

  int64_t Balance(const std::string& stream, const std::string& projection = kBalances) {
    auto value = runner->ReadModel(projection, stream);
    return value ? std::stoll(*value) : 0;
  }

  std::shared_ptr<MemoryRepository>        repo    = std::make_shared<MemoryRepository>();
  std::shared_ptr<EventJournal>            journal = std::make_shared<EventJournal>(repo);
  std::shared_ptr<StreamLocks>             locks   = std::make_shared<StreamLocks>();
  std::shared_ptr<SequenceDeadLetterQueue> dlq     = std::make_shared<SequenceDeadLetterQueue>(repo, journal, locks);
  std::shared_ptr<ProjectionRunner>        runner  = std::make_shared<ProjectionRunner>(repo, journal, dlq, locks);
};

void TestAppliesAndCheckpoints() {
  Fixture f;
  f.runner->RegisterProjection(kBalances, BalanceProjection);

  f.Append("acct-1", {Deposited(10), Deposited(5), Withdrawn(3)});

  assert(f.runner->Checkpoint(kBalances, "acct-1") == 3);
  assert(f.Balance("acct-1") == 12);
  assert(f.runner->IsCaughtUp(kBalances));
}

void TestRedeliveryIsIdempotent() {
  Fixture f(false);
  f.runner->RegisterProjection(kBalances, BalanceProjection);

  auto appended = f.Append("acct-1", {Deposited(10)});
  assert(f.runner->ConsumeFor(kBalances, appended.events[0]) == ConsumeOutcome::kApplied);
  assert(f.runner->ConsumeFor(kBalances, appended.events[0]) == ConsumeOutcome::kDuplicate);
  f.runner->Consume(appended);

  assert(f.Balance("acct-1") == 10);
  assert(f.runner->Checkpoint(kBalances, "acct-1") == 1);
}

void TestGapIsFilledFromJournal() {
  Fixture f(false);
  f.runner->RegisterProjection(kBalances, BalanceProjection);

  auto appended = f.Append("acct-1", {Deposited(1), Deposited(2), Deposited(4)});

  // only the last event is delivered
  assert(f.runner->ConsumeFor(kBalances, appended.events[2]) == ConsumeOutcome::kApplied);
  assert(f.runner->Checkpoint(kBalances, "acct-1") == 3);
  assert(f.Balance("acct-1") == 7);
}

void TestReadModelRowCarriesSourceVersion() {
  Fixture f;
  f.runner->RegisterProjection(kBalances, BalanceProjection);
  f.Append("acct-1", {Deposited(1), Deposited(1)});

  auto tx  = f.repo->Begin();
  auto row = f.repo->GetReadModel(*tx, kBalances, "acct-1");
  tx->Commit();
  assert(row.has_value());
  assert(row->version == 2);
}

void TestFailureQuarantinesOnlyThatStream() {
  Fixture        f;
  FaultyBalances balances;
  balances.faults.insert({"S", 5});
  f.runner->RegisterProjection(kBalances, balances.Fn());

  f.Append("S", {Deposited(1), Deposited(1), Deposited(1), Deposited(1)});
  f.Append("S", {Deposited(1)});
  assert(f.dlq->Quarantined().Contains(kBalances, "S"));
  assert(f.runner->Checkpoint(kBalances, "S") == 4);

  for (int i = 0; i < 100; ++i) {
    f.Append("T", {Deposited(1)});
    f.Append("S", {Deposited(1)});
  }

  // T kept flowing, S kept queueing
  assert(f.runner->Checkpoint(kBalances, "T") == 100);
  assert(f.Balance("T") == 100);
  assert(f.runner->Checkpoint(kBalances, "S") == 4);
  assert(f.Balance("S") == 4);

  auto entry = f.dlq->Get(kBalances, "S");
  assert(entry->failed_at_version == 5);
  assert(entry->last_queued_version == 105);
  assert(entry->queued_count == 101);
  assert(!f.runner->IsCaughtUp(kBalances));

  // still failing: nothing moves
  auto result = f.runner->Redrive(kBalances, "S");
  assert(result.outcome == RedriveOutcome::kPartial);
  assert(result.applied == 0);
  assert(result.failed_at_version == 5);

  balances.faults.clear();
  result = f.runner->Redrive(kBalances, "S");
  assert(result.outcome == RedriveOutcome::kSucceeded);
  assert(result.applied == 101);
  assert(f.runner->Checkpoint(kBalances, "S") == 105);
  assert(f.Balance("S") == 105);
  assert(!f.dlq->Quarantined().Contains(kBalances, "S"));
  assert(f.runner->IsCaughtUp(kBalances));

  // flowing again
  f.Append("S", {Deposited(1)});
  assert(f.runner->Checkpoint(kBalances, "S") == 106);
}

void TestRedriveFailureKeepsOrderedProgress() {
  Fixture        f;
  FaultyBalances balances;
  balances.faults.insert({"S", 2});
  f.runner->RegisterProjection(kBalances, balances.Fn());

  f.Append("S", {Deposited(1)});
  f.Append("S", {Deposited(2)});
  f.Append("S", {Deposited(4)});
  f.Append("S", {Deposited(8)});
  f.Append("S", {Deposited(16)});
  assert(f.dlq->Get(kBalances, "S")->queued_count == 4);

  // first fault fixed, a later one appears
  balances.faults.clear();
  balances.faults.insert({"S", 4});
  auto result = f.runner->Redrive(kBalances, "S");
  assert(result.outcome == RedriveOutcome::kPartial);
  assert(result.applied == 2);
  assert(result.failed_at_version == 4);
  assert(f.runner->Checkpoint(kBalances, "S") == 3);
  assert(f.Balance("S") == 7);
  assert(f.dlq->Get(kBalances, "S")->queued_count == 2);
}

void TestAccountScenario() {
  Fixture        f;
  FaultyBalances balances;
  balances.faults.insert({"acct-42", 2});
  f.runner->RegisterProjection(kBalances, balances.Fn());

  f.Append("acct-42", {Deposited(100)});
  f.Append("acct-42", {Withdrawn(30)});

  Rehydrator<Account> rehydrator(f.journal, nullptr, std::make_shared<AccountDefinition>());
  assert(rehydrator.Rehydrate("acct-42").state.balance == 70);

  auto entry = f.dlq->Get(kBalances, "acct-42");
  assert(entry.has_value());
  assert(entry->failed_at_version == 2);
  auto queued = f.dlq->QueuedEvents(kBalances, "acct-42");
  assert(queued.size() == 1);
  assert(queued[0].type == "Withdrawn");

  f.Append("acct-42", {Deposited(10)});
  assert(f.dlq->QueuedEvents(kBalances, "acct-42").size() == 2);
  assert(f.Balance("acct-42") == 100);

  f.Append("acct-99", {Deposited(5)});
  f.Append("acct-99", {Deposited(6)});
  assert(f.Balance("acct-99") == 11);

  balances.faults.clear();
  auto results = f.runner->RedriveStream("acct-42");
  assert(results.size() == 1);
  assert(results[0].outcome == RedriveOutcome::kSucceeded);
  assert(results[0].applied == 2);
  assert(f.Balance("acct-42") == 80);
  assert(!f.dlq->Get(kBalances, "acct-42").has_value());
  assert(f.dlq->List().empty());
}

void TestProjectionsFailIndependently() {
  Fixture        f;
  FaultyBalances balances;
  balances.faults.insert({"acct-1", 1});
  f.runner->RegisterProjection(kBalances, balances.Fn());
  f.runner->RegisterProjection("audit", BalanceProjection);

  f.Append("acct-1", {Deposited(3)});
  f.Append("acct-1", {Deposited(4)});

  assert(f.dlq->Quarantined().Contains(kBalances, "acct-1"));
  assert(!f.dlq->Quarantined().Contains("audit", "acct-1"));
  assert(f.Balance("acct-1", "audit") == 7);
  assert(f.runner->Checkpoint(kBalances, "acct-1") == 0);
  assert(f.runner->IsCaughtUp("audit"));
  assert(!f.runner->IsCaughtUp(kBalances));
}

void TestCatchUpPullsFromCheckpoints() {
  Fixture f(false);
  f.Append("acct-1", {Deposited(1), Deposited(2)});
  f.Append("acct-2", {Deposited(5)});

  f.runner->RegisterProjection(kBalances, BalanceProjection);
  assert(!f.runner->IsCaughtUp(kBalances));

  assert(f.runner->CatchUp(kBalances) == 3);
  assert(f.runner->CatchUp(kBalances) == 0);
  assert(f.Balance("acct-1") == 3);
  assert(f.Balance("acct-2") == 5);

  f.Append("acct-1", {Deposited(10)});
  assert(f.runner->CatchUpAll() == 1);
  assert(f.Balance("acct-1") == 13);
}

void TestCatchUpExtendsQuarantinedTail() {
  Fixture        f(false);
  FaultyBalances balances;
  balances.faults.insert({"acct-1", 2});
  f.runner->RegisterProjection(kBalances, balances.Fn());

  f.Append("acct-1", {Deposited(1), Deposited(1), Deposited(1)});
  assert(f.runner->CatchUp(kBalances) == 1);
  assert(f.dlq->Get(kBalances, "acct-1")->last_queued_version == 3);

  f.Append("acct-1", {Deposited(1), Deposited(1)});
  assert(f.runner->CatchUp(kBalances) == 0);
  auto entry = f.dlq->Get(kBalances, "acct-1");
  assert(entry->failed_at_version == 2);
  assert(entry->last_queued_version == 5);
}

void TestFullReplayRebuilds() {
  Fixture        f;
  FaultyBalances balances;
  balances.faults.insert({"acct-2", 1});
  f.runner->RegisterProjection(kBalances, balances.Fn());

  f.Append("acct-1", {Deposited(1), Deposited(2)});
  f.Append("acct-2", {Deposited(5)});
  assert(f.dlq->Quarantined().Contains(kBalances, "acct-2"));

  balances.faults.clear();
  assert(f.runner->Replay(kBalances) == 3);
  assert(f.Balance("acct-1") == 3);
  assert(f.Balance("acct-2") == 5);
  assert(f.dlq->List().empty());
  assert(f.runner->IsCaughtUp(kBalances));
}

void TestPartialReplayReappliesTail() {
  Fixture f;
  int     applications = 0;
  f.runner->RegisterProjection("last-seen", [&](ReadModelWriter& writer, const Event& event) {
    ++applications;
    writer.Put(event.stream_id, std::to_string(event.version));
  });

  f.Append("acct-1", {Deposited(1), Deposited(1), Deposited(1), Deposited(1), Deposited(1)});
  assert(applications == 5);

  assert(f.runner->Replay("last-seen", 3) == 3);
  assert(applications == 8);
  assert(f.runner->Checkpoint("last-seen", "acct-1") == 5);
  assert(*f.runner->ReadModel("last-seen", "acct-1") == "5");
}

void TestCutoverRequiresCaughtUpProjection() {
  Fixture f;
  f.runner->RegisterProjection("balances-v1", BalanceProjection);
  f.Append("acct-1", {Deposited(1), Deposited(2)});

  f.runner->Cutover("balances", "balances-v1");
  assert(*f.runner->ResolveAlias("balances") == "balances-v1");

  // v2 registers late and has not caught up yet
  FaultyBalances v2;
  v2.faults.insert({"acct-1", 2});
  f.runner->RegisterProjection("balances-v2", v2.Fn());

  bool threw = false;
  try {
    f.runner->Cutover("balances", "balances-v2");
  } catch (const ledger::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(*f.runner->ResolveAlias("balances") == "balances-v1");

  // caught up except for a quarantined stream: still refused
  f.runner->CatchUp("balances-v2");
  assert(f.dlq->Quarantined().Contains("balances-v2", "acct-1"));
  threw = false;
  try {
    f.runner->Cutover("balances", "balances-v2");
  } catch (const ledger::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  v2.faults.clear();
  assert(f.runner->Redrive("balances-v2", "acct-1").outcome == RedriveOutcome::kSucceeded);
  f.runner->Cutover("balances", "balances-v2");
  assert(*f.runner->ResolveAlias("balances") == "balances-v2");
  assert(*f.runner->ReadModel("balances-v2", "acct-1") == "3");

  assert(!f.runner->ResolveAlias("missing").has_value());
}

void TestRegistryValidation() {
  Fixture f;
  f.runner->RegisterProjection(kBalances, BalanceProjection);
  assert(f.runner->HasProjection(kBalances));
  assert(f.runner->Projections().size() == 1);

  bool threw = false;
  try {
    f.runner->RegisterProjection(kBalances, BalanceProjection);
  } catch (const ledger::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.runner->RegisterProjection("", BalanceProjection);
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.runner->CatchUp("unknown");
  } catch (const ledger::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.runner->Cutover("", kBalances);
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentWritersOnOneStream() {
  Fixture f;
  f.runner->RegisterProjection(kBalances, BalanceProjection);

  constexpr int kThreads  = 4;
  constexpr int kCommands = 25;

  auto               rehydrator = std::make_shared<const Rehydrator<Account>>(f.journal, nullptr, std::make_shared<AccountDefinition>());
  ConcurrencyOptions options;
  options.max_attempts = kThreads * kCommands;
  ConcurrencyController<Account> controller(f.journal, rehydrator, options);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kCommands; ++i) {
        controller.Execute("acct-hot", [](const Account&, uint64_t) { return std::vector<NewEvent>{Deposited(1)}; });
      }
    });
  }
  for (auto& t : threads) t.join();

  // out-of-order dispatch is absorbed by gap fill and duplicate detection
  assert(f.journal->StreamVersion("acct-hot") == kThreads * kCommands);
  assert(f.runner->Checkpoint(kBalances, "acct-hot") == kThreads * kCommands);
  assert(f.Balance("acct-hot") == kThreads * kCommands);
  assert(f.dlq->List().empty());
}

} // namespace

int main() {
  TestAppliesAndCheckpoints();
  TestRedeliveryIsIdempotent();
  TestGapIsFilledFromJournal();
  TestReadModelRowCarriesSourceVersion();
  TestFailureQuarantinesOnlyThatStream();
  TestRedriveFailureKeepsOrderedProgress();
  TestAccountScenario();
  TestProjectionsFailIndependently();
  TestCatchUpPullsFromCheckpoints();
  TestCatchUpExtendsQuarantinedTail();
  TestFullReplayRebuilds();
  TestPartialReplayReappliesTail();
  TestCutoverRequiresCaughtUpProjection();
  TestRegistryValidation();
  TestConcurrentWritersOnOneStream();

  std::cout << "event_ledger_unit_projection_runner: pass\n";
  return 0;
}
