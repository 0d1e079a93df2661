#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "jobhub/manager/v1.hpp"

namespace jobhub::history {

/*
  Per-job capped execution log.

  Records are kept in start order; once a job holds more than the
  retention cap the oldest record is evicted. Sequence numbers keep
  increasing across evictions.
*/
class HistoryLedger {
 public:
  explicit HistoryLedger(std::size_t retention_per_job);

  std::size_t retention() const {
    return retention_;
  }

  // Next creation-order sequence for a job, starting at 1.
  std::uint64_t NextSequence(const std::string& job_id);

  void Append(const jobhub::manager::v1::Execution& execution);

  // Replaces the record with the same execution_id. Returns false when the
  // record was already evicted.
  bool Update(const jobhub::manager::v1::Execution& execution);

  // Newest first; limit 0 returns everything retained.
  std::vector<jobhub::manager::v1::Execution> List(const std::string& job_id, std::size_t limit = 0) const;

  std::optional<jobhub::manager::v1::Execution> Find(const std::string& job_id, const std::string& execution_id) const;

  std::size_t Count(const std::string& job_id) const;

  // Loads persisted records (any order); keeps the newest `retention`.
  void Restore(const std::string& job_id, std::vector<jobhub::manager::v1::Execution> executions);

 private:
  struct JobLog {
    std::deque<jobhub::manager::v1::Execution> entries;
    std::uint64_t                              last_sequence{0};
  };

  const std::size_t retention_;

  mutable std::mutex                      mutex_;
  std::unordered_map<std::string, JobLog> logs_;
};

} // namespace jobhub::history
