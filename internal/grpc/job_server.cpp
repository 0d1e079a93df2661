#include "job_server.hpp"

#include "grpc_error.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::grpc {

JobServer::JobServer(std::shared_ptr<jobhub::service::JobService> svc) : service_(std::move(svc)) {
}

::grpc::Status JobServer::ListJobs(::grpc::ServerContext*, const jobhub::manager::v1::ListJobsRequest* req,
                                   jobhub::manager::v1::ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*, const jobhub::manager::v1::GetJobRequest* req, jobhub::manager::v1::GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::UpdateJob(::grpc::ServerContext*, const jobhub::manager::v1::UpdateJobRequest* req,
                                    jobhub::manager::v1::UpdateJobResponse* resp) {
  try {
    *resp = service_->UpdateJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::RunJob(::grpc::ServerContext*, const jobhub::manager::v1::RunJobRequest* req, jobhub::manager::v1::RunJobResponse* resp) {
  try {
    *resp = service_->RunJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CancelJob(::grpc::ServerContext*, const jobhub::manager::v1::CancelJobRequest* req,
                                    jobhub::manager::v1::CancelJobResponse* resp) {
  try {
    *resp = service_->CancelJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListExecutions(::grpc::ServerContext*, const jobhub::manager::v1::ListExecutionsRequest* req,
                                         jobhub::manager::v1::ListExecutionsResponse* resp) {
  try {
    *resp = service_->ListExecutions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::WatchEvents(::grpc::ServerContext* ctx, const jobhub::manager::v1::WatchEventsRequest*,
                                      ::grpc::ServerWriter<jobhub::manager::v1::JobEvent>* writer) {
  try {
    service_->WatchEvents([writer](const jobhub::manager::v1::JobEvent& event) { return writer->Write(event); },
                          [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace jobhub::grpc
