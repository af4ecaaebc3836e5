#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if LEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ledger::factory {

using observability::StringField;
using observability::UintField;

namespace {

util::RetryPolicy ToRetryPolicy(const ledger::runtime::config::StorageRetryConfig& config) {
  util::RetryPolicy policy;
  if (config.max_attempts() > 0) policy.max_attempts = config.max_attempts();
  if (config.initial_backoff_ms() > 0) policy.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms());
  if (config.max_backoff_ms() > 0) policy.max_backoff = std::chrono::milliseconds(config.max_backoff_ms());
  return policy;
}

std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LEDGER_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    const auto  busy_ms   = sqlite.busy_timeout_ms() > 0 ? sqlite.busy_timeout_ms() : 5000u;
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), busy_ms);
    sqlite_db->Migrate();
    LEDGER_LOG_INFO("sqlite journal opened", {StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LEDGER_DB_POSTGRES
    const auto& postgres = database.postgres();
    const auto  max_conn = postgres.max_connections() > 0 ? postgres.max_connections() : 16u;
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_conn);
    pool->Migrate();
    LEDGER_LOG_INFO("postgres journal opened", {UintField("max_connections", max_conn)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::InvalidArgument("postgres backend requested but not enabled at build time");
#endif
  }

  LEDGER_LOG_INFO("in-memory journal opened");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

Runtime::~Runtime() {
  if (worker) {
    worker->Stop();
  }
}

core::EventStoreOptions ToOptions(const ledger::runtime::config::RuntimeConfig& config) {
  core::EventStoreOptions options;

  const auto& journal = config.journal();
  options.storage_retry = ToRetryPolicy(journal.storage_retry());
  if (journal.read_batch_size() > 0) options.journal.read_batch_size = journal.read_batch_size();
  options.journal.storage_retry     = options.storage_retry;
  options.projections.storage_retry = options.storage_retry;

  const auto& snapshots = config.snapshots();
  if (snapshots.every_n_events() > 0) options.snapshots.every_n_events = snapshots.every_n_events();
  if (snapshots.max_age_ms() > 0) options.snapshots.max_age = std::chrono::milliseconds(snapshots.max_age_ms());
  options.snapshots.retain_history = snapshots.retain_history();
  options.snapshot_on_rehydrate    = !snapshots.disable_snapshot_on_rehydrate();

  const auto& concurrency = config.concurrency();
  if (concurrency.max_attempts() > 0) options.concurrency.max_attempts = concurrency.max_attempts();
  options.concurrency.serialize_per_stream = concurrency.serialize_per_stream();

  const auto& redrive = config.dlq().auto_redrive();
  if (redrive.initial_backoff_ms() > 0) options.redrive_backoff.initial = std::chrono::milliseconds(redrive.initial_backoff_ms());
  if (redrive.max_backoff_ms() > 0) options.redrive_backoff.max = std::chrono::milliseconds(redrive.max_backoff_ms());

  options.dispatch_on_append = !config.projections().disable_dispatch_on_append();
  return options;
}

Runtime BuildRuntime(const ledger::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  runtime.store = std::make_shared<core::EventStore>(std::move(repository), ToOptions(config));

  // ------------------------------------------------------------------
  // Projection worker
  // ------------------------------------------------------------------
  const auto& projections = config.projections();
  if (projections.poll_interval_ms() > 0) {
    projection::WorkerOptions worker_options;
    worker_options.poll_interval = std::chrono::milliseconds(projections.poll_interval_ms());
    worker_options.auto_redrive  = config.dlq().auto_redrive().enabled();
    runtime.worker = std::make_shared<projection::ProjectionWorker>(runtime.store->Projections(), runtime.store->DeadLetters(), worker_options);
  } else if (config.dlq().auto_redrive().enabled()) {
    LEDGER_LOG_WARN("dlq.auto_redrive is enabled but projections.poll_interval_ms is 0; automatic redrive will not run");
  }

  return runtime;
}

void Start(Runtime& runtime, const ledger::runtime::config::RuntimeConfig& config) {
  if (!runtime.store) {
    throw util::InvalidState("runtime has no event store");
  }

  if (config.projections().skip_catch_up_on_start()) {
    runtime.store->DeadLetters()->Hydrate();
  } else {
    runtime.store->Start();
  }

  if (runtime.worker) {
    runtime.worker->Start();
  }
}

} // namespace ledger::factory
