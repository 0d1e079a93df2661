#include "history_ledger.hpp"

#include <algorithm>

namespace jobhub::history {

using jobhub::manager::v1::Execution;

HistoryLedger::HistoryLedger(std::size_t retention_per_job) : retention_(std::max<std::size_t>(retention_per_job, 1)) {
}

std::uint64_t HistoryLedger::NextSequence(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  return ++logs_[job_id].last_sequence;
}

void HistoryLedger::Append(const Execution& execution) {
  std::lock_guard lock(mutex_);
  auto&           log = logs_[execution.job_id()];
  log.entries.push_back(execution);
  log.last_sequence = std::max(log.last_sequence, execution.sequence());
  while (log.entries.size() > retention_) {
    log.entries.pop_front();
  }
}

bool HistoryLedger::Update(const Execution& execution) {
  std::lock_guard lock(mutex_);
  auto            it = logs_.find(execution.job_id());
  if (it == logs_.end()) {
    return false;
  }

  auto& entries = it->second.entries;
  auto  entry   = std::find_if(entries.rbegin(), entries.rend(),
                               [&](const Execution& candidate) { return candidate.execution_id() == execution.execution_id(); });
  if (entry == entries.rend()) {
    return false;
  }
  *entry = execution;
  return true;
}

std::vector<Execution> HistoryLedger::List(const std::string& job_id, std::size_t limit) const {
  std::lock_guard lock(mutex_);
  auto            it = logs_.find(job_id);
  if (it == logs_.end()) {
    return {};
  }

  const auto& entries = it->second.entries;
  const auto  count   = limit == 0 ? entries.size() : std::min(limit, entries.size());

  std::vector<Execution> result;
  result.reserve(count);
  for (auto entry = entries.rbegin(); entry != entries.rend() && result.size() < count; ++entry) {
    result.push_back(*entry);
  }
  return result;
}

std::optional<Execution> HistoryLedger::Find(const std::string& job_id, const std::string& execution_id) const {
  std::lock_guard lock(mutex_);
  auto            it = logs_.find(job_id);
  if (it == logs_.end()) {
    return std::nullopt;
  }
  for (const auto& entry : it->second.entries) {
    if (entry.execution_id() == execution_id) {
      return entry;
    }
  }
  return std::nullopt;
}

std::size_t HistoryLedger::Count(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  auto            it = logs_.find(job_id);
  return it == logs_.end() ? 0 : it->second.entries.size();
}

void HistoryLedger::Restore(const std::string& job_id, std::vector<Execution> executions) {
  std::sort(executions.begin(), executions.end(), [](const Execution& a, const Execution& b) { return a.sequence() < b.sequence(); });

  std::lock_guard lock(mutex_);
  auto&           log = logs_[job_id];
  log.entries.clear();
  for (auto& execution : executions) {
    log.last_sequence = std::max(log.last_sequence, execution.sequence());
    log.entries.push_back(std::move(execution));
  }
  while (log.entries.size() > retention_) {
    log.entries.pop_front();
  }
}

} // namespace jobhub::history
