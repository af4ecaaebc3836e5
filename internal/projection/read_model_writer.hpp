#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace ledger::projection {

/*
  A projection's view of its own read-model rows, bound to the
  transaction that will also advance its checkpoint. Nothing written
  here is visible until that transaction commits.
*/
class ReadModelWriter {
 public:
  ReadModelWriter(db::Repository& repository, db::Transaction& tx, std::string projection, uint64_t source_version);

  std::optional<std::string> Get(const std::string& key) const;
  void                       Put(const std::string& key, std::string value);
  void                       Erase(const std::string& key);

  const std::string& Projection() const {
    return projection_;
  }
  uint64_t SourceVersion() const {
    return source_version_;
  }

 private:
  db::Repository&  repository_;
  db::Transaction& tx_;
  std::string      projection_;
  uint64_t         source_version_;
};

} // namespace ledger::projection
