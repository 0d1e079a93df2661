#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/model/job_state.hpp"
#include "internal/service/event_json.hpp"
#include "internal/util/time.hpp"
#include "jobhub/manager/services/v1/job_service.grpc.pb.h"
#include "jobhub/manager/v1.hpp"

using namespace jobhub::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  jobctl <addr> list\n"
            << "  jobctl <addr> get <job_id>\n"
            << "  jobctl <addr> run <job_id> [--force]\n"
            << "  jobctl <addr> cancel <job_id>\n"
            << "  jobctl <addr> executions <job_id> [limit]\n"
            << "  jobctl <addr> enable <job_id>\n"
            << "  jobctl <addr> disable <job_id>\n"
            << "  jobctl <addr> watch\n";
}

static std::string FormatTime(const google::protobuf::Timestamp& ts) {
  return jobhub::util::IsSet(ts) ? jobhub::util::FormatRfc3339(jobhub::util::FromProto(ts)) : "-";
}

static void PrintJob(const Job& job) {
  std::cout << job.id() << "  " << job.name() << "  type=" << job.type() << "  enabled=" << (job.enabled() ? "true" : "false")
            << "  state=" << jobhub::model::StateName(job.state()) << "  last=" << jobhub::model::StatusName(job.last_status())
            << "  last_run=" << FormatTime(job.last_run_at()) << "  next_run=" << FormatTime(job.next_run_at()) << "\n";
  if (!job.last_error().empty()) {
    std::cout << "  last_error: " << job.last_error() << "\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = JobService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListJobsResponse resp;
    auto             status = stub->ListJobs(&ctx, ListJobsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& job : resp.jobs()) {
      PrintJob(job);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    auto     reader = stub->WatchEvents(&ctx, WatchEventsRequest{});
    JobEvent event;
    while (reader->Read(&event)) {
      std::cout << jobhub::service::EncodeEventJson(event) << std::endl;
    }
    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  if (argc < 4) {
    Usage();
    return 1;
  }
  const std::string job_id = argv[3];

  // ------------------------------------------------------------

  if (cmd == "get") {
    GetJobRequest req;
    req.set_id(job_id);

    GetJobResponse resp;
    auto           status = stub->GetJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJob(resp.job());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    RunJobRequest req;
    req.set_id(job_id);
    req.set_force(argc >= 5 && std::string(argv[4]) == "--force");

    RunJobResponse resp;
    auto           status = stub->RunJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "execution_id=" << resp.execution_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    CancelJobRequest req;
    req.set_id(job_id);

    CancelJobResponse resp;
    auto              status = stub->CancelJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cancelled=" << resp.cancelled_executions() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "executions") {
    ListExecutionsRequest req;
    req.set_id(job_id);
    if (argc >= 5) {
      req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));
    }

    ListExecutionsResponse resp;
    auto                   status = stub->ListExecutions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& execution : resp.executions()) {
      std::cout << "#" << execution.sequence() << "  " << execution.execution_id() << "  " << jobhub::model::TriggerName(execution.trigger())
                << "  " << jobhub::model::StatusName(execution.status()) << "  started=" << FormatTime(execution.started_at())
                << "  duration_ms=" << execution.duration_ms() << "  " << execution.message() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enable" || cmd == "disable") {
    UpdateJobRequest req;
    req.set_id(job_id);
    req.mutable_patch()->set_enabled(cmd == "enable");

    UpdateJobResponse resp;
    auto              status = stub->UpdateJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJob(resp.job());
    return 0;
  }

  Usage();
  return 1;
}
