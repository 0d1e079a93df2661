#include "job_service.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <type_traits>

#include "internal/core/job_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jobhub::service {

using namespace jobhub::manager::v1;

namespace {

// Upper bound on one wait for the next update so a vanished client is
// noticed promptly even when no events flow.
constexpr std::chrono::milliseconds kStreamPollInterval{250};

void RequireId(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidRequest("job id is required");
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* job_id, Fn&& fn) {
  jobhub::observability::SpanScope span(route);
  if (job_id) {
    span.SetAttribute("job.id", *job_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    jobhub::observability::Metrics::Instance().RecordRequest(route, success);
    jobhub::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    JOBHUB_LOG_WARN("RPC failed", {jobhub::observability::StringField("route", route), jobhub::observability::StringField("error", ex.what()),
                                   jobhub::observability::StringField("job_id", job_id ? *job_id : "")});
    record(false);
    throw;
  }
}

JobEvent MakeEvent(EventType type) {
  JobEvent event;
  event.set_type(type);
  *event.mutable_timestamp() = util::ToProto(util::Now());
  return event;
}

// Releases the manager subscription when the stream ends.
class SubscriptionGuard {
 public:
  SubscriptionGuard(core::JobManager& manager, std::shared_ptr<events::Subscription> subscription)
      : manager_(manager), subscription_(std::move(subscription)) {
  }

  ~SubscriptionGuard() {
    manager_.Unsubscribe(subscription_);
  }

  SubscriptionGuard(const SubscriptionGuard&)            = delete;
  SubscriptionGuard& operator=(const SubscriptionGuard&) = delete;

  events::Subscription& operator*() const {
    return *subscription_;
  }

 private:
  core::JobManager&                     manager_;
  std::shared_ptr<events::Subscription> subscription_;
};

} // namespace

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager) {
    throw std::runtime_error("job service requires a job manager");
  }
}

ListJobsResponse JobService::ListJobs(const ListJobsRequest&) {
  return ObserveRpc("ListJobs", nullptr, [&] {
    ListJobsResponse resp;
    for (auto& job : ctx_.manager->GetJobs()) {
      *resp.add_jobs() = std::move(job);
    }
    return resp;
  });
}

GetJobResponse JobService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("GetJob", &req.id(), [&] {
    RequireId(req.id());
    GetJobResponse resp;
    *resp.mutable_job() = ctx_.manager->GetJob(req.id());
    return resp;
  });
}

UpdateJobResponse JobService::UpdateJob(const UpdateJobRequest& req) {
  return ObserveRpc("UpdateJob", &req.id(), [&] {
    RequireId(req.id());
    UpdateJobResponse resp;
    *resp.mutable_job() = ctx_.manager->UpdateJob(req.id(), req.patch());
    return resp;
  });
}

RunJobResponse JobService::RunJob(const RunJobRequest& req) {
  return ObserveRpc("RunJob", &req.id(), [&] {
    RequireId(req.id());
    RunJobResponse resp;
    resp.set_execution_id(ctx_.manager->RunJob(req.id(), req.force()));
    return resp;
  });
}

CancelJobResponse JobService::CancelJob(const CancelJobRequest& req) {
  return ObserveRpc("CancelJob", &req.id(), [&] {
    RequireId(req.id());
    CancelJobResponse resp;
    resp.set_cancelled_executions(static_cast<uint32_t>(ctx_.manager->CancelJob(req.id())));
    return resp;
  });
}

ListExecutionsResponse JobService::ListExecutions(const ListExecutionsRequest& req) {
  return ObserveRpc("ListExecutions", &req.id(), [&] {
    RequireId(req.id());
    const std::size_t limit = req.limit() == 0 ? kDefaultExecutionLimit : req.limit();

    ListExecutionsResponse resp;
    for (auto& execution : ctx_.manager->GetJobExecutions(req.id(), limit)) {
      *resp.add_executions() = std::move(execution);
    }
    return resp;
  });
}

void JobService::WatchEvents(const EventSink& sink, const Cancelled& cancelled) {
  SubscriptionGuard subscription(*ctx_.manager, ctx_.manager->Subscribe());
  jobhub::observability::Metrics::Instance().RecordRequest("WatchEvents", true);
  JOBHUB_LOG_DEBUG("event stream opened", {jobhub::observability::IntField("subscription", static_cast<int64_t>((*subscription).id()))});

  if (!sink(MakeEvent(EVENT_TYPE_CONNECTED))) {
    return;
  }

  const auto keepalive     = std::chrono::duration_cast<std::chrono::milliseconds>(ctx_.keepalive_interval);
  auto       last_activity = std::chrono::steady_clock::now();

  while (!cancelled()) {
    const auto idle    = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - last_activity);
    const auto timeout = std::clamp(keepalive - idle, std::chrono::milliseconds(1), kStreamPollInterval);

    if (auto update = (*subscription).Next(timeout)) {
      auto event              = MakeEvent(EVENT_TYPE_JOB_UPDATE);
      *event.mutable_update() = std::move(*update);
      if (!sink(event)) {
        break;
      }
      last_activity = std::chrono::steady_clock::now();
      continue;
    }

    if ((*subscription).IsClosed()) {
      break;
    }

    if (std::chrono::steady_clock::now() - last_activity >= keepalive) {
      if (!sink(MakeEvent(EVENT_TYPE_PING))) {
        break;
      }
      last_activity = std::chrono::steady_clock::now();
    }
  }

  JOBHUB_LOG_DEBUG("event stream closed", {jobhub::observability::IntField("subscription", static_cast<int64_t>((*subscription).id())),
                                           jobhub::observability::IntField("dropped", static_cast<int64_t>((*subscription).dropped()))});
}

} // namespace jobhub::service
