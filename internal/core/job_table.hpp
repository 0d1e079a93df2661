#pragma once

#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/jobs/cancellation.hpp"
#include "internal/jobs/job_store.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::core {

struct InFlightRun {
  std::shared_ptr<jobs::CancellationToken> token;
  jobhub::manager::v1::Trigger             trigger{jobhub::manager::v1::TRIGGER_MANUAL};
  bool                                     forced{false};
};

/*
  Mutable job state shared by the manager and the executor.

  `mutex` guards every member. State transitions and the events that
  describe them happen under it, which gives each subscriber per-job
  ordering.
*/
struct JobTable {
  std::mutex              mutex;
  std::condition_variable settled;

  jobs::JobStore store;

  // job id -> execution id -> run
  std::unordered_map<std::string, std::map<std::string, InFlightRun>> in_flight;

  // false before Start() and after Stop()
  bool accepting = false;

  std::size_t InFlightCountLocked() const {
    std::size_t count = 0;
    for (const auto& [_, runs] : in_flight) {
      count += runs.size();
    }
    return count;
  }
};

} // namespace jobhub::core
