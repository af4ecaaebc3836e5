#include "read_model_writer.hpp"

#include "internal/db/api/result.hpp"
#include "internal/util/time.hpp"

namespace ledger::projection {

ReadModelWriter::ReadModelWriter(db::Repository& repository, db::Transaction& tx, std::string projection, uint64_t source_version)
    : repository_(repository), tx_(tx), projection_(std::move(projection)), source_version_(source_version) {
}

std::optional<std::string> ReadModelWriter::Get(const std::string& key) const {
  auto row = repository_.GetReadModel(tx_, projection_, key);
  if (!row) return std::nullopt;
  return std::move(row->value);
}

void ReadModelWriter::Put(const std::string& key, std::string value) {
  db::model::ReadModelRecord row;
  row.projection    = projection_;
  row.key           = key;
  row.value         = std::move(value);
  row.version       = source_version_;
  row.updated_at_ms = util::NowMillis();
  db::ThrowIfError(repository_.UpsertReadModel(tx_, row), "put read model " + projection_ + "/" + key);
}

void ReadModelWriter::Erase(const std::string& key) {
  db::ThrowIfError(repository_.DeleteReadModel(tx_, projection_, key), "erase read model " + projection_ + "/" + key);
}

} // namespace ledger::projection
