#include <assert.h>

#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/history/history_ledger.hpp"
#include "jobhub/manager/v1.hpp"

namespace {

using jobhub::history::HistoryLedger;
using jobhub::manager::v1::EXECUTION_STATUS_RUNNING;
using jobhub::manager::v1::EXECUTION_STATUS_SUCCEEDED;
using jobhub::manager::v1::Execution;

Execution Started(HistoryLedger& ledger, const std::string& job_id) {
  Execution execution;
  execution.set_sequence(ledger.NextSequence(job_id));
  execution.set_execution_id(job_id + "-" + std::to_string(execution.sequence()));
  execution.set_job_id(job_id);
  execution.set_status(EXECUTION_STATUS_RUNNING);
  ledger.Append(execution);
  return execution;
}

void TestNewestFirstWithLimit() {
  HistoryLedger ledger(10);
  for (int i = 0; i < 4; ++i) {
    Started(ledger, "job");
  }

  auto all = ledger.List("job");
  assert(all.size() == 4);
  assert(all.front().sequence() == 4 && all.back().sequence() == 1);

  auto two = ledger.List("job", 2);
  assert(two.size() == 2);
  assert(two[0].sequence() == 4 && two[1].sequence() == 3);

  assert(ledger.List("other").empty());
  assert(ledger.List("job", 100).size() == 4);
}

void TestRetentionEvictsOldest() {
  HistoryLedger ledger(3);
  for (int i = 0; i < 7; ++i) {
    Started(ledger, "job");
  }

  assert(ledger.Count("job") == 3);
  auto all = ledger.List("job");
  assert(all[0].sequence() == 7 && all[2].sequence() == 5);
  assert(ledger.NextSequence("job") == 8);
  assert(!ledger.Find("job", "job-1").has_value());
}

void TestUpdateReplacesRecord() {
  HistoryLedger ledger(2);
  auto          first = Started(ledger, "job");
  first.set_status(EXECUTION_STATUS_SUCCEEDED);
  assert(ledger.Update(first));
  assert(ledger.Find("job", first.execution_id())->status() == EXECUTION_STATUS_SUCCEEDED);

  Started(ledger, "job");
  Started(ledger, "job");
  // evicted by the two newer records
  assert(!ledger.Update(first));
}

void TestRestoreKeepsNewestInOrder() {
  HistoryLedger          ledger(2);
  std::vector<Execution> stored(3);
  for (int i = 0; i < 3; ++i) {
    stored[i].set_job_id("job");
    stored[i].set_sequence(static_cast<uint64_t>(3 - i));
    stored[i].set_execution_id("stored-" + std::to_string(3 - i));
  }

  ledger.Restore("job", stored);
  auto all = ledger.List("job");
  assert(all.size() == 2);
  assert(all[0].sequence() == 3 && all[1].sequence() == 2);
  assert(ledger.NextSequence("job") == 4);
}

void TestConcurrentAppendsStayCapped() {
  HistoryLedger            ledger(16);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        Started(ledger, "job");
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto all = ledger.List("job");
  assert(all.size() == 16);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i - 1].sequence() > all[i].sequence());
  }
  assert(all.front().sequence() == 200);
}

} // namespace

int main() {
  TestNewestFirstWithLimit();
  TestRetentionEvictsOldest();
  TestUpdateReplacesRecord();
  TestRestoreKeepsNewestInOrder();
  TestConcurrentAppendsStayCapped();

  std::cout << "jobhub_unit_history_ledger: pass\n";
  return 0;
}
