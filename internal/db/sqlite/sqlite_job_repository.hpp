#pragma once

#include <memory>

#include "internal/db/api/job_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace jobhub::db::sqlite {

class SqliteJobRepository final : public db::JobRepository {
 public:
  explicit SqliteJobRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                                          UpsertJob(Transaction&, const jobhub::manager::v1::JobDefinition&) override;
  std::vector<jobhub::manager::v1::JobDefinition> ListJobs(Transaction&) override;

  Result                                      UpsertExecution(Transaction&, const jobhub::manager::v1::Execution&) override;
  std::vector<jobhub::manager::v1::Execution> ListExecutions(Transaction&, const std::string& job_id, std::size_t limit) override;
  Result                                      TrimExecutions(Transaction&, const std::string& job_id, std::size_t keep) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace jobhub::db::sqlite
