#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/executor.hpp"
#include "internal/core/job_table.hpp"
#include "internal/core/scheduler_loop.hpp"
#include "internal/db/api/job_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/history/history_ledger.hpp"
#include "internal/jobs/handler_registry.hpp"
#include "internal/util/time.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::core {

struct JobManagerOptions {
  std::chrono::milliseconds tick_interval{1000};
  std::size_t               retention_per_job{50};
  std::size_t               subscriber_buffer_size{64};
};

/*
  Facade over the job table, the executor, the scheduler loop, the
  execution history and the event bus.

  Every public call is safe to use from any thread. Calls that reject a
  request throw the util:: error types; failures of the work itself never
  surface here and only show up in history and on the event bus.

  The repository is optional. Without one nothing outlives the process.
*/
class JobManager {
 public:
  JobManager(JobManagerOptions options, std::shared_ptr<const jobs::HandlerRegistry> handlers,
             std::shared_ptr<db::JobRepository> repository = nullptr);
  ~JobManager();

  JobManager(const JobManager&)            = delete;
  JobManager& operator=(const JobManager&) = delete;

  // Throws util::InvalidConfig or util::AlreadyExists. An empty id is
  // replaced by a fresh UUID.
  jobhub::manager::v1::Job CreateJob(const jobhub::manager::v1::JobDefinition& definition);

  // Ordered by id.
  std::vector<jobhub::manager::v1::Job> GetJobs();
  jobhub::manager::v1::Job              GetJob(const std::string& id);

  /*
    Throws:
      util::NotFound       unknown job
      util::Conflict       job is running or cancelling
      util::InvalidConfig  patched job fails validation (job unchanged)
  */
  jobhub::manager::v1::Job UpdateJob(const std::string& id, const jobhub::manager::v1::JobPatch& patch);

  // Returns the execution id once the run is accepted.
  std::string RunJob(const std::string& id, bool force);
  std::size_t CancelJob(const std::string& id);

  // Newest first; limit 0 returns the whole retained history.
  std::vector<jobhub::manager::v1::Execution> GetJobExecutions(const std::string& id, std::size_t limit);

  std::shared_ptr<events::Subscription> Subscribe();
  void                                  Unsubscribe(const std::shared_ptr<events::Subscription>& subscription);

  // Loads stored definitions and history from the repository. Stored
  // definitions replace jobs with the same id. Must run before Start().
  void Restore();

  // Returns false when already started or after Stop().
  bool Start();

  // Stops the scheduler, cancels and waits for every in-flight execution,
  // then closes all subscriptions. Idempotent.
  void Stop();

  bool IsRunning();

  // One scheduler tick: submits every enabled, idle job that is due at `now`.
  void RunDueJobs(util::TimePoint now);

  std::size_t retention() const {
    return ledger_->retention();
  }

 private:
  void PersistDefinition(const jobhub::manager::v1::Job& job);

  JobManagerOptions                            options_;
  std::shared_ptr<const jobs::HandlerRegistry> handlers_;
  std::shared_ptr<db::JobRepository>           repository_;
  std::shared_ptr<history::HistoryLedger>      ledger_;
  std::shared_ptr<events::EventBus>            bus_;

  JobTable      table_;
  Executor      executor_;
  SchedulerLoop loop_;

  std::mutex lifecycle_mutex_;
  bool       started_ = false;
  bool       stopped_ = false;
};

} // namespace jobhub::core
