#pragma once

#include <functional>

#include "jobhub/manager/services/v1/job_service.pb.h"
#include "jobhub/manager/v1.hpp"
#include "service_context.hpp"

namespace jobhub::service {

class JobService {
 public:
  // Returns false once the consumer is gone.
  using EventSink = std::function<bool(const jobhub::manager::v1::JobEvent&)>;
  using Cancelled = std::function<bool()>;

  static constexpr std::size_t kDefaultExecutionLimit = 10;

  explicit JobService(ServiceContext ctx);

  jobhub::manager::v1::ListJobsResponse ListJobs(const jobhub::manager::v1::ListJobsRequest& req);

  jobhub::manager::v1::GetJobResponse GetJob(const jobhub::manager::v1::GetJobRequest& req);

  jobhub::manager::v1::UpdateJobResponse UpdateJob(const jobhub::manager::v1::UpdateJobRequest& req);

  jobhub::manager::v1::RunJobResponse RunJob(const jobhub::manager::v1::RunJobRequest& req);

  jobhub::manager::v1::CancelJobResponse CancelJob(const jobhub::manager::v1::CancelJobRequest& req);

  jobhub::manager::v1::ListExecutionsResponse ListExecutions(const jobhub::manager::v1::ListExecutionsRequest& req);

  /*
    Streams CONNECTED, then one JOB_UPDATE per status update and a PING
    after each keepalive interval without traffic. Returns when the sink
    reports the consumer gone, `cancelled` returns true, or the manager
    closes the subscription on shutdown.
  */
  void WatchEvents(const EventSink& sink, const Cancelled& cancelled);

 private:
  ServiceContext ctx_;
};

} // namespace jobhub::service
