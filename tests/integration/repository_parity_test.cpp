#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/event_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/account_aggregate.hpp"

#if LEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if LEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using ledger::db::ErrorCode;
using ledger::db::Repository;
using ledger::db::memory::MemoryRepository;
using ledger::db::model::CheckpointRecord;
using ledger::db::model::DlqEntryRecord;
using ledger::db::model::EventRecord;
using ledger::db::model::ReadModelRecord;
using ledger::db::model::SnapshotRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

EventRecord MakeRecord(const std::string& event_id, const std::string& type, const std::string& payload) {
  EventRecord e;
  e.event_id       = event_id;
  e.type           = type;
  e.payload        = payload;
  e.correlation_id = "corr";
  e.occurred_at_ms = NowMs();
  return e;
}

void VerifyAppendAndRead(Repository& repo, const std::string& stream) {
  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> batch{MakeRecord(stream + "-e1", "Opened", "a"), MakeRecord(stream + "-e2", "Deposited", "10"),
                                   MakeRecord(stream + "-e3", "Deposited", "20")};
    assert(repo.AppendEvents(*tx, stream, 0, batch));
    assert(batch[0].version == 1);
    assert(batch[2].version == 3);
    assert(batch[2].stream_id == stream);
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto head = repo.GetStream(*tx, stream);
  assert(head.has_value());
  assert(head->version == 3);
  assert(head->created_at_ms > 0);

  auto all = repo.ReadEvents(*tx, stream, 1, 100, std::nullopt);
  assert(all.size() == 3);
  assert(all[0].version == 1 && all[1].version == 2 && all[2].version == 3);
  assert(all[1].payload == "10");
  assert(all[1].correlation_id == "corr");
  assert(all[1].recorded_at_ms > 0);

  auto page = repo.ReadEvents(*tx, stream, 2, 3, 1);
  assert(page.size() == 1);
  assert(page[0].version == 2);

  auto found = repo.GetEventById(*tx, stream + "-e3");
  assert(found.has_value());
  assert(found->stream_id == stream);
  assert(found->version == 3);
  assert(!repo.GetEventById(*tx, stream + "-missing").has_value());

  bool listed = false;
  for (const auto& s : repo.ListStreams(*tx)) {
    listed = listed || (s.stream_id == stream && s.version == 3);
  }
  assert(listed);
  tx->Commit();
}

void VerifyOptimisticCheck(Repository& repo, const std::string& stream) {
  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> batch{MakeRecord(stream + "-o1", "Opened", "")};
    assert(repo.AppendEvents(*tx, stream, 0, batch));
    tx->Commit();
  }

  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> stale{MakeRecord(stream + "-o2", "Deposited", "1")};
    auto                     r = repo.AppendEvents(*tx, stream, 0, stale);
    assert(r.code == ErrorCode::Conflict);
    tx->Rollback();
  }

  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> duplicate{MakeRecord(stream + "-o1", "Deposited", "1")};
    auto                     r = repo.AppendEvents(*tx, stream, 1, duplicate);
    assert(r.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(repo.GetStream(*tx, stream)->version == 1);
  assert(repo.ReadEvents(*tx, stream, 1, 10, std::nullopt).size() == 1);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& stream) {
  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> batch{MakeRecord(stream + "-r1", "Opened", "")};
    assert(repo.AppendEvents(*tx, stream, 0, batch));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetStream(*tx, stream).has_value());
  assert(!repo.GetEventById(*tx, stream + "-r1").has_value());
  tx->Commit();
}

void VerifyBinaryPayloadAndShred(Repository& repo, const std::string& stream) {
  const std::string binary("\x00\x01\xfe\xff payload", 12);
  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> batch{MakeRecord(stream + "-b1", "Blob", binary), MakeRecord(stream + "-b2", "Blob", "keep")};
    assert(repo.AppendEvents(*tx, stream, 0, batch));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto events = repo.ReadEvents(*tx, stream, 1, 1, std::nullopt);
    assert(events.size() == 1);
    assert(events[0].payload == binary);
    assert(!events[0].shredded);

    assert(repo.ShredEventPayload(*tx, stream + "-b1"));
    assert(repo.ShredEventPayload(*tx, stream + "-nope").code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto events = repo.ReadEvents(*tx, stream, 1, 2, std::nullopt);
  assert(events.size() == 2);
  assert(events[0].shredded);
  assert(events[0].payload.empty());
  assert(events[0].type == "Blob");
  assert(events[0].version == 1);
  assert(!events[1].shredded);
  assert(events[1].payload == "keep");
  tx->Commit();
}

void VerifySnapshots(Repository& repo, const std::string& stream) {
  auto tx = repo.Begin();
  assert(!repo.GetLatestSnapshot(*tx, stream).has_value());

  SnapshotRecord s2{.stream_id = stream, .version = 2, .state = "two", .taken_at_ms = NowMs()};
  SnapshotRecord s3{.stream_id = stream, .version = 3, .state = "three", .taken_at_ms = NowMs()};
  assert(repo.InsertSnapshot(*tx, s2));
  assert(repo.InsertSnapshot(*tx, s3));
  tx->Commit();

  tx = repo.Begin();
  assert(repo.InsertSnapshot(*tx, s3).code == ErrorCode::AlreadyExists);
  tx->Rollback();

  tx = repo.Begin();
  assert(repo.DeleteSnapshotsBefore(*tx, stream, 3));
  auto latest = repo.GetLatestSnapshot(*tx, stream);
  assert(latest.has_value());
  assert(latest->version == 3);
  assert(latest->state == "three");
  tx->Commit();
}

void VerifyProjectionState(Repository& repo, const std::string& projection) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertCheckpoint(*tx, CheckpointRecord{projection, "s-1", 4, NowMs()}));
    assert(repo.UpsertCheckpoint(*tx, CheckpointRecord{projection, "s-2", 1, NowMs()}));
    assert(repo.UpsertCheckpoint(*tx, CheckpointRecord{projection, "s-1", 5, NowMs()}));
    assert(repo.UpsertReadModel(*tx, ReadModelRecord{projection, "k-1", "v-1", 5, NowMs()}));
    assert(repo.UpsertReadModel(*tx, ReadModelRecord{projection, "k-2", "v-2", 1, NowMs()}));
    assert(repo.UpsertReadModel(*tx, ReadModelRecord{projection, "k-1", "v-1b", 6, NowMs()}));
    assert(repo.UpsertProjectionAlias(*tx, projection + "-alias", projection));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.GetCheckpoint(*tx, projection, "s-1")->last_applied_version == 5);
    assert(repo.ListCheckpoints(*tx, projection).size() == 2);
    assert(!repo.GetCheckpoint(*tx, projection, "s-3").has_value());

    auto row = repo.GetReadModel(*tx, projection, "k-1");
    assert(row.has_value());
    assert(row->value == "v-1b");
    assert(row->version == 6);

    assert(repo.DeleteReadModel(*tx, projection, "k-2"));
    assert(!repo.GetReadModel(*tx, projection, "k-2").has_value());
    assert(*repo.GetProjectionAlias(*tx, projection + "-alias") == projection);

    assert(repo.UpsertProjectionAlias(*tx, projection + "-alias", projection + "-v2"));
    assert(*repo.GetProjectionAlias(*tx, projection + "-alias") == projection + "-v2");
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteReadModels(*tx, projection));
  assert(repo.DeleteCheckpoints(*tx, projection));
  assert(!repo.GetReadModel(*tx, projection, "k-1").has_value());
  assert(repo.ListCheckpoints(*tx, projection).empty());
  tx->Commit();
}

void VerifyDlqEntries(Repository& repo, const std::string& projection) {
  DlqEntryRecord entry;
  entry.projection          = projection;
  entry.stream_id           = "s-1";
  entry.failed_at_version   = 5;
  entry.last_queued_version = 7;
  entry.reason              = "boom";
  entry.enqueued_at_ms      = NowMs();
  entry.updated_at_ms       = entry.enqueued_at_ms;
  entry.next_redrive_at_ms  = entry.enqueued_at_ms + 1000;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertDlqEntry(*tx, entry));
    entry.stream_id = "s-2";
    assert(repo.UpsertDlqEntry(*tx, entry));
    tx->Commit();
  }

  {
    auto tx                   = repo.Begin();
    auto stored               = repo.GetDlqEntry(*tx, projection, "s-1");
    assert(stored.has_value());
    assert(stored->failed_at_version == 5);
    assert(stored->last_queued_version == 7);
    assert(stored->reason == "boom");
    assert(stored->next_redrive_at_ms == entry.next_redrive_at_ms);

    stored->last_queued_version = 9;
    stored->redrive_attempts    = 2;
    assert(repo.UpsertDlqEntry(*tx, *stored));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto updated = repo.GetDlqEntry(*tx, projection, "s-1");
    assert(updated->last_queued_version == 9);
    assert(updated->redrive_attempts == 2);

    size_t mine = 0;
    for (const auto& e : repo.ListDlqEntries(*tx)) {
      if (e.projection == projection) ++mine;
    }
    assert(mine == 2);

    assert(repo.DeleteDlqEntry(*tx, projection, "s-1"));
    assert(!repo.GetDlqEntry(*tx, projection, "s-1").has_value());
    assert(repo.DeleteDlqEntries(*tx, projection));
    assert(!repo.GetDlqEntry(*tx, projection, "s-2").has_value());
    tx->Commit();
  }
}

void VerifyEventStoreEndToEnd(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  ledger::core::EventStore store(repo);
  const auto               projection = prefix + "-balances";
  const auto               stream     = prefix + "-acct";

  store.RegisterProjection(projection, ledger::testing::BalanceProjection);
  store.Append(stream, 0, {ledger::testing::Deposited(100)});
  store.Append(stream, 1, {ledger::testing::Withdrawn(30), ledger::testing::Deposited(10)});

  assert(store.StreamVersion(stream) == 3);
  assert(store.Projections()->Checkpoint(projection, stream) == 3);
  assert(*store.Projections()->ReadModel(projection, stream) == "80");

  auto rehydrator = store.MakeRehydrator<ledger::testing::Account>(std::make_shared<ledger::testing::AccountDefinition>());
  assert(rehydrator->Rehydrate(stream).state.balance == 80);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto                     tx = repo->Begin();
    std::vector<EventRecord> batch{MakeRecord(prefix + "-d1", "Opened", "x"), MakeRecord(prefix + "-d2", "Deposited", "1")};
    assert(repo->AppendEvents(*tx, prefix + "-durable", 0, batch));

    DlqEntryRecord entry;
    entry.projection          = prefix + "-proj";
    entry.stream_id           = prefix + "-durable";
    entry.failed_at_version   = 2;
    entry.last_queued_version = 2;
    entry.reason              = "boom";
    assert(repo->UpsertDlqEntry(*tx, entry));
    assert(repo->UpsertCheckpoint(*tx, CheckpointRecord{prefix + "-proj", prefix + "-durable", 1, NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetStream(*tx, prefix + "-durable")->version == 2);
  assert(repo->ReadEvents(*tx, prefix + "-durable", 1, 2, std::nullopt).size() == 2);
  assert(repo->GetDlqEntry(*tx, prefix + "-proj", prefix + "-durable")->failed_at_version == 2);
  assert(repo->GetCheckpoint(*tx, prefix + "-proj", prefix + "-durable")->last_applied_version == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if LEDGER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("event_ledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<ledger::db::sqlite::SqliteDB>(db_path);
    db->Migrate();
    return std::make_shared<ledger::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if LEDGER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("LEDGER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("LEDGER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<ledger::db::postgres::PgPool>(conninfo);
    pool->Migrate();
    return std::make_shared<ledger::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // postgres keeps rows between runs
  const auto prefix = backend.name + "-" + std::to_string(NowMs());
  auto       repo   = backend.make_repository();

  VerifyAppendAndRead(*repo, prefix + "-read");
  VerifyOptimisticCheck(*repo, prefix + "-occ");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyBinaryPayloadAndShred(*repo, prefix + "-binary");
  VerifySnapshots(*repo, prefix + "-snap");
  VerifyProjectionState(*repo, prefix + "-proj");
  VerifyDlqEntries(*repo, prefix + "-dlq");
  VerifyEventStoreEndToEnd(repo, prefix + "-store");

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LEDGER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if LEDGER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "event_ledger_integration_repository_parity: pass\n";
  return 0;
}
