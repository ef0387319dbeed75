#pragma once

#include <memory>

#include "internal/db/api/record_index.hpp"
#include "sqlite_db.hpp"

namespace blobkeep::db::sqlite {

class SqliteRecordIndex final : public db::RecordIndex {
public:
  // Bootstraps the schema on `db`.
  explicit SqliteRecordIndex(std::shared_ptr<SqliteDB> db);

  std::optional<model::Item> Get(const std::string& id) override;
  Result Insert(const model::Item& item) override;
  Result Delete(const std::string& id) override;
  std::vector<model::Item> FindExpiredBefore(util::TimePoint cutoff) override;
  std::vector<std::string> ListIds() override;
  void Close() override;

private:
  sqlite3* Handle() const;

  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
