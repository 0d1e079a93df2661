#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/core/job_table.hpp"
#include "internal/db/api/job_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/history/history_ledger.hpp"
#include "internal/jobs/handler_registry.hpp"
#include "internal/jobs/job_handler.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::core {

/*
  Runs job work functions.

  Submit() accepts or rejects a run synchronously and starts the work on
  its own thread. Each execution moves through

    RUNNING -> SUCCEEDED | FAILED | CANCELLED

  and the owning job through IDLE -> RUNNING [-> CANCELLING] -> IDLE.
  Anything thrown by a work function is contained here and recorded as a
  failed execution.

  When forced runs overlap, last_status/last_run_at/last_error follow the
  execution that settles last, and the job returns to IDLE only after its
  last in-flight execution settles.
*/
class Executor {
 public:
  Executor(JobTable& table, std::shared_ptr<const jobs::HandlerRegistry> handlers, std::shared_ptr<history::HistoryLedger> ledger,
           std::shared_ptr<events::EventBus> bus, std::shared_ptr<db::JobRepository> repository);
  ~Executor();

  Executor(const Executor&)            = delete;
  Executor& operator=(const Executor&) = delete;

  /*
    Throws:
      util::NotFound        unknown job
      util::InvalidRequest  not accepting runs, or disabled and not forced
      util::Conflict        already running and not forced

    Returns the execution id.
  */
  std::string Submit(const std::string& job_id, jobhub::manager::v1::Trigger trigger, bool force);

  /*
    Signals every in-flight execution of the job. Returns how many were
    signalled.

    Throws util::NotFound or util::InvalidRequest (not running).
  */
  std::size_t Cancel(const std::string& job_id);

  // Signals every in-flight execution of every job.
  std::size_t CancelAll();

  // Blocks until no execution is in flight and every worker thread joined.
  void WaitIdle();

 private:
  struct Run {
    jobhub::manager::v1::Execution           execution;
    jobhub::manager::v1::Job                 job;
    std::shared_ptr<jobs::CancellationToken> token;
    std::shared_ptr<jobs::JobHandler>        handler;
  };

  void Execute(Run run);
  void Settle(Run& run, const jobs::WorkResult& result);

  void PublishLocked(const std::string& job_id, const std::string& execution_id, jobhub::manager::v1::UpdateKind kind,
                     const std::string& message);

  void Persist(const jobhub::manager::v1::Execution& execution, bool terminal);

  void Launch(const std::string& execution_id, Run run);
  void ReapLocked();

  JobTable&                                    table_;
  std::shared_ptr<const jobs::HandlerRegistry> handlers_;
  std::shared_ptr<history::HistoryLedger>      ledger_;
  std::shared_ptr<events::EventBus>            bus_;
  std::shared_ptr<db::JobRepository>           repository_;

  std::mutex                                   threads_mutex_;
  std::unordered_map<std::string, std::thread> threads_;
  std::vector<std::string>                     finished_;
};

} // namespace jobhub::core
