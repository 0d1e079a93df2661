#include <assert.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/job_manager.hpp"
#include "internal/jobs/handler_registry.hpp"
#include "internal/jobs/job_handler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "jobhub/manager/v1.hpp"

namespace {

using jobhub::core::JobManager;
using jobhub::core::JobManagerOptions;
using jobhub::jobs::HandlerRegistry;
using jobhub::jobs::JobContext;
using jobhub::jobs::JobHandler;
using jobhub::jobs::WorkResult;
using namespace jobhub::manager::v1;

/*
  Behaviour is picked by config.mode:
    instant  succeed immediately
    fail     return a failure
    throw    throw from the work function
    block    wait for Release() or cancellation
    stubborn wait for Release() and ignore cancellation
*/
class ScriptedHandler final : public JobHandler {
 public:
  void Validate(const google::protobuf::Struct& config) const override {
    const auto it = config.fields().find("mode");
    if (it == config.fields().end()) {
      throw jobhub::util::InvalidConfig("mode is required");
    }
    const auto& mode = it->second.string_value();
    if (mode != "instant" && mode != "fail" && mode != "throw" && mode != "block" && mode != "stubborn") {
      throw jobhub::util::InvalidConfig("unknown mode: " + mode);
    }
  }

  WorkResult Run(JobContext& context) override {
    runs_.fetch_add(1);
    const auto mode = context.job().config().fields().at("mode").string_value();
    if (mode == "fail") {
      return WorkResult::Failure("boom");
    }
    if (mode == "throw") {
      throw std::runtime_error("exploded");
    }
    if (mode == "block") {
      context.Report("waiting");
      while (!released_.load()) {
        if (context.token().WaitFor(std::chrono::milliseconds(5))) {
          return WorkResult::Failure("stopped early");
        }
      }
    }
    if (mode == "stubborn") {
      while (!released_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    }
    return WorkResult::Success();
  }

  void Release() {
    released_.store(true);
  }

  int runs() const {
    return runs_.load();
  }

 private:
  std::atomic<bool> released_{false};
  std::atomic<int>  runs_{0};
};

struct Fixture {
  std::shared_ptr<ScriptedHandler> handler = std::make_shared<ScriptedHandler>();
  std::unique_ptr<JobManager>      manager;

  explicit Fixture(JobManagerOptions options = Options()) {
    auto registry = std::make_shared<HandlerRegistry>();
    registry->Register("scripted", handler);
    manager = std::make_unique<JobManager>(options, registry);
  }

  static JobManagerOptions Options() {
    JobManagerOptions options;
    options.tick_interval     = std::chrono::milliseconds(20);
    options.retention_per_job = 50;
    return options;
  }
};

JobDefinition Definition(const std::string& id, const std::string& mode, ScheduleType schedule = SCHEDULE_TYPE_MANUAL,
                         uint32_t interval_seconds = 0) {
  JobDefinition definition;
  definition.set_id(id);
  definition.set_name("Job " + id);
  definition.set_type("scripted");
  definition.set_enabled(true);
  definition.mutable_schedule()->set_type(schedule);
  definition.mutable_schedule()->set_interval_seconds(interval_seconds);
  (*definition.mutable_config()->mutable_fields())["mode"].set_string_value(mode);
  return definition;
}

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

bool WaitIdle(JobManager& manager, const std::string& id) {
  return WaitUntil([&] { return manager.GetJob(id).state() == JOB_STATE_IDLE; });
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestScheduledIntervalJobRuns() {
  Fixture f;
  f.manager->CreateJob(Definition("a", "instant", SCHEDULE_TYPE_INTERVAL, 1));
  assert(f.manager->Start());

  const bool ran = WaitUntil(
      [&] {
        auto history = f.manager->GetJobExecutions("a", 0);
        return !history.empty() && history.front().trigger() == TRIGGER_SCHEDULED && history.front().status() == EXECUTION_STATUS_SUCCEEDED;
      },
      std::chrono::seconds(4));
  assert(ran && "interval job must run on its own");

  assert(WaitIdle(*f.manager, "a"));
  const auto job = f.manager->GetJob("a");
  assert(job.last_status() == EXECUTION_STATUS_SUCCEEDED);
  assert(jobhub::util::IsSet(job.next_run_at()));
  assert(jobhub::util::FromProto(job.next_run_at()) > jobhub::util::FromProto(job.last_run_at()));
  f.manager->Stop();
}

void TestSecondRunWhileRunningConflicts() {
  Fixture f;
  f.manager->CreateJob(Definition("b", "block"));
  f.manager->Start();

  f.manager->RunJob("b", false);
  assert(f.manager->GetJob("b").state() == JOB_STATE_RUNNING);
  assert(Throws<jobhub::util::Conflict>([&] { f.manager->RunJob("b", false); }));

  f.handler->Release();
  assert(WaitIdle(*f.manager, "b"));
  auto history = f.manager->GetJobExecutions("b", 0);
  assert(history.size() == 1);
  assert(history.front().status() == EXECUTION_STATUS_SUCCEEDED);
  assert(history.front().message() == "Job Job b completed successfully");
  f.manager->Stop();
}

void TestCancelRunningJob() {
  Fixture f;
  f.manager->CreateJob(Definition("c", "block"));
  f.manager->Start();

  f.manager->RunJob("c", false);
  assert(f.manager->CancelJob("c") == 1);

  assert(WaitIdle(*f.manager, "c"));
  auto history = f.manager->GetJobExecutions("c", 0);
  assert(history.size() == 1);
  assert(history.front().status() == EXECUTION_STATUS_CANCELLED);
  assert(jobhub::util::IsSet(history.front().ended_at()));
  assert(f.manager->GetJob("c").last_status() == EXECUTION_STATUS_CANCELLED);
  f.manager->Stop();
}

void TestCancelPublishesCancellingThenCancelled() {
  Fixture f;
  f.manager->CreateJob(Definition("k", "stubborn"));
  f.manager->Start();
  auto subscription = f.manager->Subscribe();

  f.manager->RunJob("k", false);
  assert(f.manager->CancelJob("k") == 1);

  // the work function has not looked at its token yet
  assert(f.manager->GetJob("k").state() == JOB_STATE_CANCELLING);
  assert(Throws<jobhub::util::Conflict>([&] { f.manager->RunJob("k", false); }));

  f.handler->Release();
  assert(WaitIdle(*f.manager, "k"));

  std::vector<UpdateKind> kinds;
  while (kinds.empty() || kinds.back() != UPDATE_KIND_CANCELLED) {
    auto update = subscription->Next(std::chrono::seconds(5));
    assert(update.has_value());
    if (update->job_id() == "k" && update->kind() != UPDATE_KIND_PROGRESS) {
      kinds.push_back(update->kind());
    }
  }
  assert(kinds.size() == 3);
  assert(kinds[0] == UPDATE_KIND_STARTED);
  assert(kinds[1] == UPDATE_KIND_CANCELLING);
  assert(kinds[2] == UPDATE_KIND_CANCELLED);

  const auto execution = f.manager->GetJobExecutions("k", 1).front();
  assert(execution.status() == EXECUTION_STATUS_CANCELLED);
  assert(execution.message() == "Job Job k cancelled");

  f.manager->Unsubscribe(subscription);
  f.manager->Stop();
}

void TestSubscriberSeesStartedThenTerminal() {
  Fixture f;
  f.manager->CreateJob(Definition("d", "instant"));
  f.manager->Start();

  auto subscription = f.manager->Subscribe();
  const auto execution_id = f.manager->RunJob("d", false);

  std::vector<StatusUpdate> seen;
  while (seen.empty() || (seen.back().kind() != UPDATE_KIND_COMPLETED && seen.back().kind() != UPDATE_KIND_FAILED)) {
    auto update = subscription->Next(std::chrono::seconds(5));
    assert(update.has_value());
    if (update->job_id() == "d") {
      seen.push_back(*update);
    }
  }

  assert(seen.front().kind() == UPDATE_KIND_STARTED);
  assert(seen.back().kind() == UPDATE_KIND_COMPLETED);
  for (std::size_t i = 0; i < seen.size(); ++i) {
    assert(seen[i].execution_id() == execution_id);
    if (i > 0) {
      const auto prev = jobhub::util::FromProto(seen[i - 1].timestamp());
      assert(jobhub::util::FromProto(seen[i].timestamp()) >= prev);
    }
  }

  f.manager->Unsubscribe(subscription);
  f.manager->Stop();
}

void TestInvalidConfigUpdateLeavesJobUnchanged() {
  Fixture f;
  f.manager->CreateJob(Definition("e", "instant"));

  JobPatch patch;
  (*patch.mutable_config()->mutable_fields())["mode"].set_string_value("bogus");
  patch.set_name("renamed");
  assert(Throws<jobhub::util::InvalidConfig>([&] { f.manager->UpdateJob("e", patch); }));

  const auto job = f.manager->GetJob("e");
  assert(job.config().fields().at("mode").string_value() == "instant");
  assert(job.name() == "Job e");

  JobPatch good;
  good.set_description("nightly");
  auto updated = f.manager->UpdateJob("e", good);
  assert(updated.description() == "nightly");
  assert(updated.config().fields().at("mode").string_value() == "instant");
}

void TestUpdateWhileRunningConflicts() {
  Fixture f;
  f.manager->CreateJob(Definition("u", "block"));
  f.manager->Start();
  f.manager->RunJob("u", false);

  JobPatch patch;
  (*patch.mutable_config()->mutable_fields())["mode"].set_string_value("fail");
  assert(Throws<jobhub::util::Conflict>([&] { f.manager->UpdateJob("u", patch); }));
  assert(f.manager->GetJob("u").config().fields().at("mode").string_value() == "block");

  f.handler->Release();
  assert(WaitIdle(*f.manager, "u"));
  f.manager->Stop();
}

void TestForcedRunOverlaps() {
  Fixture f;
  f.manager->CreateJob(Definition("f", "block"));
  f.manager->Start();

  const auto first  = f.manager->RunJob("f", false);
  const auto second = f.manager->RunJob("f", true);
  assert(first != second);

  auto history = f.manager->GetJobExecutions("f", 0);
  assert(history.size() == 2);
  assert(history[0].execution_id() == second);
  assert(history[0].forced());
  assert(history[0].sequence() == history[1].sequence() + 1);
  assert(history[0].status() == EXECUTION_STATUS_RUNNING && history[1].status() == EXECUTION_STATUS_RUNNING);

  f.handler->Release();
  assert(WaitIdle(*f.manager, "f"));
  assert(WaitUntil([&] {
    auto done = f.manager->GetJobExecutions("f", 0);
    return done[0].status() == EXECUTION_STATUS_SUCCEEDED && done[1].status() == EXECUTION_STATUS_SUCCEEDED;
  }));
  assert(f.handler->runs() == 2);
  f.manager->Stop();
}

void TestRejectedRequests() {
  Fixture f;
  auto    disabled = Definition("off", "instant");
  disabled.set_enabled(false);
  f.manager->CreateJob(disabled);
  f.manager->CreateJob(Definition("idle", "instant"));

  // not started yet
  assert(Throws<jobhub::util::InvalidRequest>([&] { f.manager->RunJob("idle", false); }));

  f.manager->Start();
  assert(Throws<jobhub::util::NotFound>([&] { f.manager->RunJob("missing", false); }));
  assert(Throws<jobhub::util::NotFound>([&] { f.manager->GetJob("missing"); }));
  assert(Throws<jobhub::util::NotFound>([&] { f.manager->GetJobExecutions("missing", 10); }));
  assert(Throws<jobhub::util::InvalidRequest>([&] { f.manager->CancelJob("idle"); }));
  assert(Throws<jobhub::util::InvalidRequest>([&] { f.manager->RunJob("off", false); }));
  assert(Throws<jobhub::util::AlreadyExists>([&] { f.manager->CreateJob(Definition("idle", "instant")); }));

  // disabled jobs still run when forced
  f.manager->RunJob("off", true);
  assert(WaitIdle(*f.manager, "off"));
  assert(!jobhub::util::IsSet(f.manager->GetJob("off").next_run_at()));

  assert(!f.manager->Start());
  f.manager->Stop();
  assert(Throws<jobhub::util::InvalidRequest>([&] { f.manager->RunJob("idle", false); }));
}

void TestWorkFailuresAreContained() {
  Fixture f;
  f.manager->CreateJob(Definition("fail", "fail"));
  f.manager->CreateJob(Definition("throw", "throw"));
  f.manager->Start();

  f.manager->RunJob("fail", false);
  f.manager->RunJob("throw", false);
  assert(WaitIdle(*f.manager, "fail"));
  assert(WaitIdle(*f.manager, "throw"));

  const auto failed = f.manager->GetJobExecutions("fail", 1).front();
  assert(failed.status() == EXECUTION_STATUS_FAILED);
  assert(failed.error() == "boom");
  assert(failed.message() == "Job Job fail failed: boom");

  const auto thrown = f.manager->GetJob("throw");
  assert(thrown.last_status() == EXECUTION_STATUS_FAILED);
  assert(thrown.last_error() == "exploded");
  f.manager->Stop();
}

void TestRetentionAndLimit() {
  auto options              = Fixture::Options();
  options.retention_per_job = 3;
  Fixture f(options);
  f.manager->CreateJob(Definition("r", "instant"));
  f.manager->Start();

  for (int i = 0; i < 5; ++i) {
    f.manager->RunJob("r", false);
    assert(WaitIdle(*f.manager, "r"));
  }

  const auto all = f.manager->GetJobExecutions("r", 0);
  assert(all.size() == 3);
  assert(all[0].sequence() == 5 && all[1].sequence() == 4 && all[2].sequence() == 3);

  const auto limited = f.manager->GetJobExecutions("r", 2);
  assert(limited.size() == 2);
  assert(limited[0].execution_id() == all[0].execution_id());
  assert(limited[1].execution_id() == all[1].execution_id());
  f.manager->Stop();
}

void TestStopCancelsInFlightAndClosesSubscriptions() {
  Fixture f;
  f.manager->CreateJob(Definition("s", "block"));
  f.manager->Start();
  auto subscription = f.manager->Subscribe();

  f.manager->RunJob("s", false);
  f.manager->Stop();

  const auto history = f.manager->GetJobExecutions("s", 0);
  assert(history.front().status() == EXECUTION_STATUS_CANCELLED);
  assert(f.manager->GetJob("s").state() == JOB_STATE_IDLE);

  bool saw_cancelled = false;
  while (auto update = subscription->TryNext()) {
    saw_cancelled = saw_cancelled || update->kind() == UPDATE_KIND_CANCELLED;
  }
  assert(saw_cancelled);
  assert(subscription->IsClosed());
  assert(!f.manager->IsRunning());
}

void TestStartupScheduleRunsOnce() {
  Fixture f;
  f.manager->CreateJob(Definition("boot", "instant", SCHEDULE_TYPE_STARTUP));
  f.manager->Start();

  assert(WaitUntil([&] { return f.manager->GetJobExecutions("boot", 0).size() == 1; }));
  assert(WaitIdle(*f.manager, "boot"));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(f.manager->GetJobExecutions("boot", 0).size() == 1);
  assert(!jobhub::util::IsSet(f.manager->GetJob("boot").next_run_at()));
  f.manager->Stop();
}

void TestDueJobSkippedWhileRunning() {
  auto options          = Fixture::Options();
  options.tick_interval = std::chrono::hours(1);
  Fixture f(options);
  f.manager->CreateJob(Definition("o", "block", SCHEDULE_TYPE_INTERVAL, 60));
  f.manager->Start();

  f.manager->RunJob("o", false);
  f.manager->RunDueJobs(jobhub::util::Now() + std::chrono::minutes(2));
  f.manager->RunDueJobs(jobhub::util::Now() + std::chrono::minutes(2));

  auto history = f.manager->GetJobExecutions("o", 0);
  assert(history.size() == 1 && "overlapping due runs are skipped, not queued");
  assert(history.front().trigger() == TRIGGER_MANUAL);

  f.handler->Release();
  assert(WaitIdle(*f.manager, "o"));
  assert(f.manager->GetJobExecutions("o", 0).size() == 1);

  // once idle the same due time starts a scheduled run
  f.manager->RunDueJobs(jobhub::util::Now() + std::chrono::minutes(2));
  history = f.manager->GetJobExecutions("o", 0);
  assert(history.size() == 2);
  assert(history.front().trigger() == TRIGGER_SCHEDULED);
  assert(WaitIdle(*f.manager, "o"));
  f.manager->Stop();
}

void TestDisabledJobIsNeverScheduled() {
  auto options          = Fixture::Options();
  options.tick_interval = std::chrono::hours(1);
  Fixture f(options);
  auto    disabled = Definition("x", "instant", SCHEDULE_TYPE_INTERVAL, 1);
  disabled.set_enabled(false);
  f.manager->CreateJob(disabled);
  f.manager->CreateJob(Definition("y", "instant", SCHEDULE_TYPE_INTERVAL, 1));
  f.manager->Start();

  // "y" becomes disabled after its next run was already computed
  JobPatch off;
  off.set_enabled(false);
  f.manager->UpdateJob("y", off);

  f.manager->RunDueJobs(jobhub::util::Now() + std::chrono::hours(24));
  assert(f.manager->GetJobExecutions("x", 0).empty());
  assert(f.manager->GetJobExecutions("y", 0).empty());
  assert(!jobhub::util::IsSet(f.manager->GetJob("x").next_run_at()));
  assert(!jobhub::util::IsSet(f.manager->GetJob("y").next_run_at()));
  assert(f.handler->runs() == 0);
  f.manager->Stop();
}

void TestNewlyDueJobWakesScheduler() {
  auto options          = Fixture::Options();
  options.tick_interval = std::chrono::hours(1);
  Fixture f(options);
  f.manager->Start();

  // the first tick already happened; only an early wake-up can run these
  f.manager->CreateJob(Definition("late", "instant", SCHEDULE_TYPE_STARTUP));
  assert(WaitUntil([&] { return f.manager->GetJobExecutions("late", 0).size() == 1; }, std::chrono::seconds(2)));

  f.manager->CreateJob(Definition("later", "instant"));
  JobPatch patch;
  patch.mutable_schedule()->set_type(SCHEDULE_TYPE_STARTUP);
  f.manager->UpdateJob("later", patch);
  assert(WaitUntil([&] { return f.manager->GetJobExecutions("later", 0).size() == 1; }, std::chrono::seconds(2)));
  assert(f.manager->GetJobExecutions("later", 0).front().trigger() == TRIGGER_SCHEDULED);
  f.manager->Stop();
}

void TestUnknownTypeNamesRegisteredTypes() {
  Fixture f;
  auto    definition = Definition("t", "instant");
  definition.set_type("ftp-sync");

  std::string message;
  try {
    f.manager->CreateJob(definition);
  } catch (const jobhub::util::InvalidConfig& e) {
    message = e.what();
  }
  assert(message.find("unknown job type: ftp-sync") != std::string::npos);
  assert(message.find("registered: scripted") != std::string::npos);
}

} // namespace

int main() {
  TestScheduledIntervalJobRuns();
  TestSecondRunWhileRunningConflicts();
  TestCancelRunningJob();
  TestCancelPublishesCancellingThenCancelled();
  TestSubscriberSeesStartedThenTerminal();
  TestInvalidConfigUpdateLeavesJobUnchanged();
  TestUpdateWhileRunningConflicts();
  TestForcedRunOverlaps();
  TestRejectedRequests();
  TestWorkFailuresAreContained();
  TestRetentionAndLimit();
  TestStopCancelsInFlightAndClosesSubscriptions();
  TestStartupScheduleRunsOnce();
  TestDueJobSkippedWhileRunning();
  TestDisabledJobIsNeverScheduled();
  TestNewlyDueJobWakesScheduler();
  TestUnknownTypeNamesRegisteredTypes();

  std::cout << "jobhub_unit_job_manager: pass\n";
  return 0;
}
