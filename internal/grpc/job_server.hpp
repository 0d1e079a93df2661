#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/job_service.hpp"
#include "jobhub/manager/services/v1/job_service.grpc.pb.h"
#include "jobhub/manager/v1.hpp"

namespace jobhub::grpc {

class JobServer final : public jobhub::manager::v1::JobService::Service {
 public:
  explicit JobServer(std::shared_ptr<jobhub::service::JobService> svc);

  ::grpc::Status ListJobs(::grpc::ServerContext*, const jobhub::manager::v1::ListJobsRequest*, jobhub::manager::v1::ListJobsResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*, const jobhub::manager::v1::GetJobRequest*, jobhub::manager::v1::GetJobResponse*) override;

  ::grpc::Status UpdateJob(::grpc::ServerContext*, const jobhub::manager::v1::UpdateJobRequest*, jobhub::manager::v1::UpdateJobResponse*) override;

  ::grpc::Status RunJob(::grpc::ServerContext*, const jobhub::manager::v1::RunJobRequest*, jobhub::manager::v1::RunJobResponse*) override;

  ::grpc::Status CancelJob(::grpc::ServerContext*, const jobhub::manager::v1::CancelJobRequest*, jobhub::manager::v1::CancelJobResponse*) override;

  ::grpc::Status ListExecutions(::grpc::ServerContext*, const jobhub::manager::v1::ListExecutionsRequest*,
                                jobhub::manager::v1::ListExecutionsResponse*) override;

  ::grpc::Status WatchEvents(::grpc::ServerContext*, const jobhub::manager::v1::WatchEventsRequest*,
                             ::grpc::ServerWriter<jobhub::manager::v1::JobEvent>*) override;

 private:
  std::shared_ptr<jobhub::service::JobService> service_;
};

} // namespace jobhub::grpc
