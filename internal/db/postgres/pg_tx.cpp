#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::failure& e) {
    throw util::StorageFailure(std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      LEDGER_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  if (finished_) throw util::InvalidState("postgres transaction already finished");
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    finished_ = true;
    throw util::StorageFailure(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace ledger::db::postgres
