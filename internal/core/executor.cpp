#include "executor.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

#include "internal/model/job_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/schedule/schedule.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace jobhub::core {

using namespace jobhub::manager::v1;
using observability::IntField;
using observability::StringField;

Executor::Executor(JobTable& table, std::shared_ptr<const jobs::HandlerRegistry> handlers, std::shared_ptr<history::HistoryLedger> ledger,
                   std::shared_ptr<events::EventBus> bus, std::shared_ptr<db::JobRepository> repository)
    : table_(table), handlers_(std::move(handlers)), ledger_(std::move(ledger)), bus_(std::move(bus)), repository_(std::move(repository)) {
}

Executor::~Executor() {
  CancelAll();
  WaitIdle();
}

std::string Executor::Submit(const std::string& job_id, Trigger trigger, bool force) {
  Run run;
  {
    std::lock_guard lock(table_.mutex);
    auto&           job = table_.store.Get(job_id);

    if (!table_.accepting) {
      throw util::InvalidRequest("job manager is not running");
    }
    if (!job.enabled() && !force) {
      throw util::InvalidRequest("job is disabled: " + job_id);
    }
    if (model::IsActive(job.state()) && !force) {
      throw util::Conflict("job already running: " + job_id);
    }

    auto handler = handlers_->Get(job.type());

    Execution execution;
    execution.set_execution_id(util::GenerateId());
    execution.set_sequence(ledger_->NextSequence(job_id));
    execution.set_job_id(job_id);
    execution.set_trigger(trigger);
    execution.set_forced(force);
    *execution.mutable_started_at() = util::ToProto(util::Now());
    execution.set_status(EXECUTION_STATUS_RUNNING);
    execution.set_message("Job " + job.name() + " started");
    ledger_->Append(execution);

    job.set_state(JOB_STATE_RUNNING);
    job.clear_next_run_at();

    auto token                                              = std::make_shared<jobs::CancellationToken>();
    table_.in_flight[job_id][execution.execution_id()] = InFlightRun{token, trigger, force};

    PublishLocked(job_id, execution.execution_id(), UPDATE_KIND_STARTED, execution.message());

    run.execution = std::move(execution);
    run.job       = job;
    run.token     = std::move(token);
    run.handler   = std::move(handler);
  }

  const auto execution_id = run.execution.execution_id();
  JOBHUB_LOG_INFO("job started", {StringField("job_id", job_id), StringField("execution_id", execution_id),
                                  StringField("trigger", model::TriggerName(trigger)), observability::BoolField("forced", force)});

  Persist(run.execution, false);
  Launch(execution_id, std::move(run));
  return execution_id;
}

std::size_t Executor::Cancel(const std::string& job_id) {
  std::lock_guard lock(table_.mutex);
  auto&           job = table_.store.Get(job_id);

  auto it = table_.in_flight.find(job_id);
  if (it == table_.in_flight.end() || it->second.empty()) {
    throw util::InvalidRequest("job is not running: " + job_id);
  }

  std::size_t signalled = 0;
  for (auto& [execution_id, run] : it->second) {
    if (run.token->IsCancelled()) {
      continue;
    }
    run.token->Cancel();
    ++signalled;
    PublishLocked(job_id, execution_id, UPDATE_KIND_CANCELLING, "Job " + job.name() + " cancelling");
  }
  job.set_state(JOB_STATE_CANCELLING);

  JOBHUB_LOG_INFO("job cancellation requested", {StringField("job_id", job_id), IntField("executions", static_cast<int64_t>(signalled))});
  return signalled;
}

std::size_t Executor::CancelAll() {
  std::lock_guard lock(table_.mutex);

  std::size_t signalled = 0;
  for (auto& [job_id, runs] : table_.in_flight) {
    auto* job = table_.store.Find(job_id);
    for (auto& [execution_id, run] : runs) {
      if (run.token->IsCancelled()) {
        continue;
      }
      run.token->Cancel();
      ++signalled;
      PublishLocked(job_id, execution_id, UPDATE_KIND_CANCELLING, "Job " + (job ? job->name() : job_id) + " cancelling");
    }
    if (job && !runs.empty()) {
      job->set_state(JOB_STATE_CANCELLING);
    }
  }
  return signalled;
}

void Executor::WaitIdle() {
  {
    std::unique_lock lock(table_.mutex);
    table_.settled.wait(lock, [&] { return table_.InFlightCountLocked() == 0; });
  }

  std::unordered_map<std::string, std::thread> threads;
  {
    std::lock_guard lock(threads_mutex_);
    threads.swap(threads_);
    finished_.clear();
  }
  for (auto& [_, thread] : threads) {
    if (thread.joinable()) thread.join();
  }
}

void Executor::Execute(Run run) {
  observability::SpanScope span("job.execute");
  span.SetAttribute("job.id", run.job.id());
  span.SetAttribute("job.type", run.job.type());
  span.SetAttribute("execution.id", run.execution.execution_id());

  const auto job_id       = run.job.id();
  const auto execution_id = run.execution.execution_id();

  jobs::JobContext context(run.job, execution_id, run.token, [this, job_id, execution_id](const std::string& message) {
    std::lock_guard lock(table_.mutex);
    PublishLocked(job_id, execution_id, UPDATE_KIND_PROGRESS, message);
  });

  jobs::WorkResult result;
  try {
    result = run.handler->Run(context);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    JOBHUB_LOG_WARN("job work failed", {StringField("job_id", job_id), StringField("execution_id", execution_id), StringField("error", e.what())});
    result = jobs::WorkResult::Failure(e.what());
  } catch (...) {
    span.RecordException("unknown exception");
    JOBHUB_LOG_ERROR("job work threw a non-standard exception", {StringField("job_id", job_id), StringField("execution_id", execution_id)});
    result = jobs::WorkResult::Failure("unknown exception");
  }

  Settle(run, result);
}

void Executor::Settle(Run& run, const jobs::WorkResult& result) {
  const auto ended     = util::Now();
  const auto started   = util::FromProto(run.execution.started_at());
  const auto duration  = std::chrono::duration_cast<std::chrono::milliseconds>(ended - started);
  const bool cancelled = run.token->IsCancelled();
  const auto& name     = run.job.name();
  const auto& job_id   = run.job.id();

  auto& execution = run.execution;
  *execution.mutable_ended_at() = util::ToProto(ended);
  execution.set_duration_ms(static_cast<uint64_t>(std::max<int64_t>(duration.count(), 0)));
  execution.set_output(result.output);
  execution.set_exit_code(result.exit_code);

  UpdateKind kind;
  if (cancelled) {
    execution.set_status(EXECUTION_STATUS_CANCELLED);
    execution.set_message("Job " + name + " cancelled");
    execution.set_error(result.succeeded ? "" : result.error);
    kind = UPDATE_KIND_CANCELLED;
  } else if (result.succeeded) {
    execution.set_status(EXECUTION_STATUS_SUCCEEDED);
    execution.set_message(result.message.empty() ? "Job " + name + " completed successfully" : result.message);
    kind = UPDATE_KIND_COMPLETED;
  } else {
    execution.set_status(EXECUTION_STATUS_FAILED);
    execution.set_message("Job " + name + " failed: " + result.error);
    execution.set_error(result.error);
    kind = UPDATE_KIND_FAILED;
  }

  {
    std::lock_guard lock(table_.mutex);

    if (!ledger_->Update(execution)) {
      JOBHUB_LOG_DEBUG("execution evicted before it settled", {StringField("execution_id", execution.execution_id())});
    }

    auto runs = table_.in_flight.find(job_id);
    if (runs != table_.in_flight.end()) {
      runs->second.erase(execution.execution_id());
      if (runs->second.empty()) {
        table_.in_flight.erase(runs);
      }
    }
    const bool idle = table_.in_flight.count(job_id) == 0;

    if (auto* job = table_.store.Find(job_id)) {
      job->set_last_status(execution.status());
      *job->mutable_last_run_at() = execution.ended_at();
      job->set_last_error(execution.status() == EXECUTION_STATUS_FAILED ? execution.error() : "");
      job->set_last_duration_ms(execution.duration_ms());

      if (idle) {
        job->set_state(JOB_STATE_IDLE);
        if (auto next = schedule::ComputeNextRun(job->schedule(), job->enabled(), ended, true)) {
          *job->mutable_next_run_at() = util::ToProto(*next);
        } else {
          job->clear_next_run_at();
        }
      }
    }

    PublishLocked(job_id, execution.execution_id(), kind, execution.message());
    table_.settled.notify_all();
  }

  const auto status_name = model::StatusName(execution.status());
  observability::Metrics::Instance().RecordExecution(run.job.type(), status_name);
  observability::Metrics::Instance().ObserveExecutionDurationMs(run.job.type(), static_cast<double>(execution.duration_ms()));
  JOBHUB_LOG_INFO("job finished", {StringField("job_id", job_id), StringField("execution_id", execution.execution_id()),
                                   StringField("status", status_name), IntField("duration_ms", static_cast<int64_t>(execution.duration_ms()))});

  Persist(execution, true);
}

void Executor::PublishLocked(const std::string& job_id, const std::string& execution_id, UpdateKind kind, const std::string& message) {
  StatusUpdate update;
  update.set_job_id(job_id);
  update.set_execution_id(execution_id);
  update.set_kind(kind);
  update.set_message(message);
  bus_->Publish(std::move(update));
}

void Executor::Persist(const Execution& execution, bool terminal) {
  if (!repository_) {
    return;
  }

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->UpsertExecution(*tx, execution);
    if (result && terminal) {
      result = repository_->TrimExecutions(*tx, execution.job_id(), ledger_->retention());
    }
    if (!result) {
      JOBHUB_LOG_WARN("persisting execution failed", {StringField("execution_id", execution.execution_id()), StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    JOBHUB_LOG_ERROR("persisting execution failed", {StringField("execution_id", execution.execution_id()), StringField("error", e.what())});
  }
}

void Executor::Launch(const std::string& execution_id, Run run) {
  auto shared = std::make_shared<Run>(std::move(run));

  std::lock_guard lock(threads_mutex_);
  ReapLocked();
  try {
    threads_.emplace(execution_id, std::thread([this, execution_id, shared] {
                       Execute(std::move(*shared));
                       std::lock_guard done(threads_mutex_);
                       finished_.push_back(execution_id);
                     }));
  } catch (const std::system_error& e) {
    JOBHUB_LOG_ERROR("failed to start job thread", {StringField("execution_id", execution_id), StringField("error", e.what())});
    Settle(*shared, jobs::WorkResult::Failure(std::string("failed to start worker: ") + e.what()));
  }
}

void Executor::ReapLocked() {
  for (const auto& id : finished_) {
    auto it = threads_.find(id);
    if (it == threads_.end()) {
      continue;
    }
    if (it->second.joinable()) it->second.join();
    threads_.erase(it);
  }
  finished_.clear();
}

} // namespace jobhub::core
