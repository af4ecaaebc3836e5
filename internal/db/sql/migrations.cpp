#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace ledger::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
  LEDGER_LOG_DEBUG("schema migrations applied", {observability::UintField("statements", ordered_sql.size())});
}

} // namespace ledger::db::sql
