#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/aggregate/aggregate.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/envelope.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

using ledger::model::Event;
using ledger::model::MakeEvent;
using ledger::projection::ReadModelWriter;

struct Account {
  int64_t balance = 0;
};

class AccountAggregate final : public ledger::aggregate::AggregateDefinition<Account> {
 public:
  AccountAggregate() {
    handlers_.On("Deposited", [](Account& a, const Event& e) { a.balance += std::stoll(e.payload); })
        .On("Withdrawn", [](Account& a, const Event& e) { a.balance -= std::stoll(e.payload); });
  }

  Account Initial() const override {
    return {};
  }
  Account Apply(Account state, const Event& event) const override {
    return handlers_.Apply(std::move(state), event);
  }
  std::string Encode(const Account& state) const override {
    return std::to_string(state.balance);
  }
  Account Decode(const std::string& bytes) const override {
    return Account{std::stoll(bytes)};
  }

 private:
  ledger::aggregate::EventHandlerTable<Account> handlers_;
};

// Stream versions the balance projection refuses, to show quarantine and redrive.
std::set<std::pair<std::string, uint64_t>> g_faults;

void ApplyBalance(ReadModelWriter& writer, const Event& event) {
  if (g_faults.contains({event.stream_id, event.version})) {
    throw std::runtime_error("simulated projection fault");
  }
  const auto current = writer.Get(event.stream_id);
  int64_t    balance = current ? std::stoll(*current) : 0;
  balance += event.type == "Withdrawn" ? -std::stoll(event.payload) : std::stoll(event.payload);
  writer.Put(event.stream_id, std::to_string(balance));
}

std::string Balance(ledger::core::EventStore& store, const std::string& projection, const std::string& stream) {
  auto value = store.Projections()->ReadModel(projection, stream);
  return value ? *value : "<none>";
}

void RunScenario(const ledger::runtime::config::RuntimeConfig& config) {
  auto  runtime = ledger::factory::BuildRuntime(config);
  auto& store   = *runtime.store;

  store.RegisterProjection("balances-v1", ApplyBalance);
  ledger::factory::Start(runtime, config);

  // ------------------------------------------------------------
  // Commands through the optimistic controller
  // ------------------------------------------------------------
  const std::string stream     = "acct-42";
  const uint64_t    start      = store.StreamVersion(stream);
  auto              controller = store.MakeController<Account>(std::make_shared<AccountAggregate>());

  controller->Execute(stream, [](const Account&, uint64_t) { return std::vector{MakeEvent("Deposited", "100")}; });

  // the withdrawal lands at start + 2; everything after it queues behind it
  g_faults.insert({stream, start + 2});
  controller->Execute(stream, [](const Account& account, uint64_t) {
    if (account.balance < 30) throw std::domain_error("insufficient funds");
    return std::vector{MakeEvent("Withdrawn", "30")};
  });
  controller->Execute(stream, [](const Account&, uint64_t) { return std::vector{MakeEvent("Deposited", "10")}; });
  store.Append("acct-99", store.StreamVersion("acct-99"), {MakeEvent("Deposited", "5")});

  auto rehydrated = store.MakeRehydrator<Account>(std::make_shared<AccountAggregate>())->Rehydrate(stream);
  std::cout << stream << " state balance=" << rehydrated.state.balance << " version=" << rehydrated.version << "\n";
  std::cout << stream << " read model balance=" << Balance(store, "balances-v1", stream) << "\n";

  for (const auto& entry : store.ListDLQ()) {
    std::cout << "dlq " << entry.projection << "/" << entry.stream_id << " failed_at=" << entry.failed_at_version
              << " queued=" << entry.queued_count << " reason=" << entry.reason << "\n";
  }

  // ------------------------------------------------------------
  // Operator redrive once the fault is fixed
  // ------------------------------------------------------------
  g_faults.clear();
  for (const auto& result : store.Redrive(stream)) {
    std::cout << "redrive " << result.projection << " -> " << ledger::dlq::ToString(result.outcome) << " applied=" << result.applied
              << "\n";
  }
  std::cout << stream << " read model balance=" << Balance(store, "balances-v1", stream) << "\n";

  // ------------------------------------------------------------
  // Blue-green: build v2 beside v1, then move the alias
  // ------------------------------------------------------------
  store.RegisterProjection("balances-v2", ApplyBalance);
  store.Replay("balances-v2");
  store.Cutover("balances", "balances-v2");
  std::cout << "alias balances -> " << store.ResolveAlias("balances").value_or("<unset>") << "\n";

  if (auto first = store.Read(stream, start + 1, start + 1).Next()) {
    std::cout << ledger::model::ToJson(*first, true) << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    // in-memory journal unless a config file is given
    auto config = argc > 1 ? ledger::config::ConfigLoader::LoadFromYaml(argv[1]) : ledger::config::ConfigLoader::LoadFromYamlString("");

    ledger::observability::InitializeTracing(config);
    ledger::observability::InitializeMetrics(config);
    ledger::observability::InitializeLogging(config);

    RunScenario(config);

    ledger::observability::ShutdownLogging();
    ledger::observability::ShutdownMetrics();
    ledger::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("example failed", {ledger::observability::StringField("error", e.what())});
    std::cerr << "account_ledger_example: " << e.what() << "\n";
    ledger::observability::ShutdownLogging();
    ledger::observability::ShutdownMetrics();
    ledger::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
