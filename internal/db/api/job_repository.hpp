#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::db {

/*
  Durable copy of job definitions and finished executions.

  All calls take an open Transaction from Begin(). The manager only reads
  through this interface at startup; afterwards it writes definitions on
  create/update and executions when they start and settle.
*/
class JobRepository {
 public:
  virtual ~JobRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Definitions
  // ---------------------------------------------------------------------

  virtual Result UpsertJob(Transaction&, const jobhub::manager::v1::JobDefinition&) = 0;

  virtual std::vector<jobhub::manager::v1::JobDefinition> ListJobs(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------

  virtual Result UpsertExecution(Transaction&, const jobhub::manager::v1::Execution&) = 0;

  // Newest first (highest sequence first); limit 0 returns all.
  virtual std::vector<jobhub::manager::v1::Execution> ListExecutions(Transaction&, const std::string& job_id, std::size_t limit) = 0;

  // Deletes all but the `keep` newest executions of a job.
  virtual Result TrimExecutions(Transaction&, const std::string& job_id, std::size_t keep) = 0;
};

} // namespace jobhub::db
