#include "job_manager.hpp"

#include <stdexcept>
#include <utility>

#include "internal/jobs/job_definition.hpp"
#include "internal/model/job_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schedule/schedule.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace jobhub::core {

using namespace jobhub::manager::v1;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ErrorCodeName(result.code)) + ")");
  }
}

void SetNextRun(Job& job, util::TimePoint reference) {
  if (auto next = schedule::ComputeNextRun(job.schedule(), job.enabled(), reference, false)) {
    *job.mutable_next_run_at() = util::ToProto(*next);
  } else {
    job.clear_next_run_at();
  }
}

// Outcome bookkeeping from the newest settled execution in history.
void ApplyLastOutcome(Job& job, const std::vector<Execution>& newest_first) {
  for (const auto& execution : newest_first) {
    if (!model::IsTerminal(execution.status())) {
      continue;
    }
    job.set_last_status(execution.status());
    *job.mutable_last_run_at() = execution.ended_at();
    job.set_last_error(execution.status() == EXECUTION_STATUS_FAILED ? execution.error() : "");
    job.set_last_duration_ms(execution.duration_ms());
    return;
  }
}

} // namespace

JobManager::JobManager(JobManagerOptions options, std::shared_ptr<const jobs::HandlerRegistry> handlers,
                       std::shared_ptr<db::JobRepository> repository)
    : options_(options),
      handlers_(std::move(handlers)),
      repository_(std::move(repository)),
      ledger_(std::make_shared<history::HistoryLedger>(options.retention_per_job)),
      bus_(std::make_shared<events::EventBus>(options.subscriber_buffer_size)),
      executor_(table_, handlers_, ledger_, bus_, repository_),
      loop_(options.tick_interval, [this](util::TimePoint now) { RunDueJobs(now); }) {
  if (!handlers_) {
    throw std::runtime_error("job manager requires a handler registry");
  }
}

JobManager::~JobManager() {
  Stop();
}

Job JobManager::CreateJob(const JobDefinition& definition) {
  const auto now = util::Now();
  Job        job = jobs::FromDefinition(definition, now);
  if (job.id().empty()) {
    job.set_id(util::GenerateId());
  }
  jobs::ValidateJob(job, *handlers_);
  SetNextRun(job, now);

  {
    std::lock_guard lock(table_.mutex);
    if (table_.store.Contains(job.id())) {
      throw util::AlreadyExists("job already exists: " + job.id());
    }
    PersistDefinition(job);
    table_.store.Insert(job);
  }
  if (util::IsSet(job.next_run_at())) {
    loop_.Poke();
  }

  JOBHUB_LOG_INFO("job created", {StringField("job_id", job.id()), StringField("name", job.name()), StringField("type", job.type())});
  return job;
}

std::vector<Job> JobManager::GetJobs() {
  std::lock_guard lock(table_.mutex);
  return table_.store.List();
}

Job JobManager::GetJob(const std::string& id) {
  std::lock_guard lock(table_.mutex);
  return table_.store.Get(id);
}

Job JobManager::UpdateJob(const std::string& id, const JobPatch& patch) {
  Job  result;
  bool rescheduled = false;
  {
    std::lock_guard lock(table_.mutex);
    auto&           current = table_.store.Get(id);
    if (model::IsActive(current.state())) {
      throw util::Conflict("job is running: " + id);
    }

    Job updated = current;
    jobs::ApplyPatch(patch, updated);
    jobs::ValidateJob(updated, *handlers_);

    const auto now = util::Now();
    *updated.mutable_updated_at() = util::ToProto(now);
    if (patch.has_schedule() || patch.has_enabled()) {
      SetNextRun(updated, now);
      rescheduled = util::IsSet(updated.next_run_at());
    }

    PersistDefinition(updated);
    current = std::move(updated);
    result  = current;
  }
  if (rescheduled) {
    loop_.Poke();
  }

  JOBHUB_LOG_INFO("job updated", {StringField("job_id", id), observability::BoolField("enabled", result.enabled())});
  return result;
}

std::string JobManager::RunJob(const std::string& id, bool force) {
  return executor_.Submit(id, TRIGGER_MANUAL, force);
}

std::size_t JobManager::CancelJob(const std::string& id) {
  return executor_.Cancel(id);
}

std::vector<Execution> JobManager::GetJobExecutions(const std::string& id, std::size_t limit) {
  {
    std::lock_guard lock(table_.mutex);
    if (!table_.store.Contains(id)) {
      throw util::NotFound("job not found: " + id);
    }
  }
  return ledger_->List(id, limit);
}

std::shared_ptr<events::Subscription> JobManager::Subscribe() {
  return bus_->Subscribe();
}

void JobManager::Unsubscribe(const std::shared_ptr<events::Subscription>& subscription) {
  bus_->Unsubscribe(subscription);
}

void JobManager::Restore() {
  if (!repository_) {
    return;
  }

  {
    std::lock_guard lock(lifecycle_mutex_);
    if (started_) {
      throw util::InvalidRequest("restore must run before the job manager starts");
    }
  }

  const auto now = util::Now();

  std::vector<JobDefinition>                                  definitions;
  std::vector<std::pair<std::string, std::vector<Execution>>> histories;
  {
    auto tx     = repository_->Begin();
    definitions = repository_->ListJobs(*tx);
    for (const auto& definition : definitions) {
      auto executions = repository_->ListExecutions(*tx, definition.id(), ledger_->retention());
      for (auto& execution : executions) {
        if (model::IsTerminal(execution.status())) {
          continue;
        }
        execution.set_status(EXECUTION_STATUS_FAILED);
        execution.set_error("interrupted by restart");
        execution.set_message("Job " + definition.name() + " failed: interrupted by restart");
        *execution.mutable_ended_at() = util::ToProto(now);
        ThrowIfDbError(repository_->UpsertExecution(*tx, execution), "mark interrupted execution " + execution.execution_id());
      }
      histories.emplace_back(definition.id(), std::move(executions));
    }
    tx->Commit();
  }

  std::size_t     restored = 0;
  std::lock_guard lock(table_.mutex);
  for (std::size_t i = 0; i < definitions.size(); ++i) {
    Job job = jobs::FromDefinition(definitions[i], now);
    try {
      jobs::ValidateJob(job, *handlers_);
    } catch (const util::InvalidConfig& e) {
      JOBHUB_LOG_WARN("skipping stored job", {StringField("job_id", job.id()), StringField("error", e.what())});
      continue;
    }

    ApplyLastOutcome(job, histories[i].second);
    SetNextRun(job, now);
    ledger_->Restore(job.id(), std::move(histories[i].second));
    table_.store.Put(std::move(job));
    ++restored;
  }

  JOBHUB_LOG_INFO("restored jobs",
                  {IntField("jobs", static_cast<int64_t>(restored)), IntField("skipped", static_cast<int64_t>(definitions.size() - restored))});
}

bool JobManager::Start() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (started_ || stopped_) {
    return false;
  }

  {
    const auto      now = util::Now();
    std::lock_guard lock(table_.mutex);
    table_.accepting = true;
    for (const auto& id : table_.store.Ids()) {
      auto& job = table_.store.Get(id);
      if (!model::IsActive(job.state())) {
        SetNextRun(job, now);
      }
    }
  }

  loop_.Start();
  started_ = true;

  JOBHUB_LOG_INFO("job manager started", {IntField("tick_interval_ms", options_.tick_interval.count())});
  return true;
}

void JobManager::Stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (stopped_) {
    return;
  }

  loop_.Stop();
  {
    std::lock_guard lock(table_.mutex);
    table_.accepting = false;
  }

  const auto cancelled = executor_.CancelAll();
  executor_.WaitIdle();
  bus_->CloseAll();
  stopped_ = true;

  JOBHUB_LOG_INFO("job manager stopped", {IntField("cancelled_executions", static_cast<int64_t>(cancelled))});
}

bool JobManager::IsRunning() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  return started_ && !stopped_;
}

void JobManager::RunDueJobs(util::TimePoint now) {
  std::vector<std::string> due;
  {
    std::lock_guard lock(table_.mutex);
    if (!table_.accepting) {
      return;
    }
    for (const auto& id : table_.store.Ids()) {
      const auto& job = table_.store.Get(id);
      if (!job.enabled() || job.state() != JOB_STATE_IDLE || !util::IsSet(job.next_run_at())) {
        continue;
      }
      if (util::FromProto(job.next_run_at()) <= now) {
        due.push_back(id);
      }
    }
  }

  for (const auto& id : due) {
    try {
      executor_.Submit(id, TRIGGER_SCHEDULED, false);
    } catch (const util::Conflict&) {
      JOBHUB_LOG_DEBUG("skipping due job already running", {StringField("job_id", id)});
    } catch (const util::InvalidRequest& e) {
      JOBHUB_LOG_DEBUG("skipping due job", {StringField("job_id", id), StringField("reason", e.what())});
    } catch (const std::exception& e) {
      JOBHUB_LOG_WARN("scheduled run failed to start", {StringField("job_id", id), StringField("error", e.what())});
    }
  }
}

void JobManager::PersistDefinition(const Job& job) {
  if (!repository_) {
    return;
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertJob(*tx, jobs::ToDefinition(job)), "persist job " + job.id());
  tx->Commit();
}

} // namespace jobhub::core
