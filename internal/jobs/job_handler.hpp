#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <google/protobuf/struct.pb.h>

#include "internal/jobs/cancellation.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::jobs {

struct WorkResult {
  bool        succeeded{true};
  std::string message;
  std::string error;
  std::string output;
  int         exit_code{0};

  static WorkResult Success(std::string message = {}) {
    WorkResult result;
    result.message = std::move(message);
    return result;
  }

  static WorkResult Failure(std::string error) {
    WorkResult result;
    result.succeeded = false;
    result.error     = std::move(error);
    return result;
  }
};

/*
  View of one execution handed to a work function.

  Report() publishes a PROGRESS update for the execution.
*/
class JobContext {
 public:
  using ProgressSink = std::function<void(const std::string&)>;

  JobContext(jobhub::manager::v1::Job job, std::string execution_id, std::shared_ptr<const CancellationToken> token, ProgressSink progress)
      : job_(std::move(job)), execution_id_(std::move(execution_id)), token_(std::move(token)), progress_(std::move(progress)) {
  }

  const jobhub::manager::v1::Job& job() const {
    return job_;
  }

  const std::string& execution_id() const {
    return execution_id_;
  }

  const CancellationToken& token() const {
    return *token_;
  }

  bool IsCancelled() const {
    return token_->IsCancelled();
  }

  void Report(const std::string& message) const {
    if (progress_) {
      progress_(message);
    }
  }

 private:
  jobhub::manager::v1::Job                 job_;
  std::string                              execution_id_;
  std::shared_ptr<const CancellationToken> token_;
  ProgressSink                             progress_;
};

/*
  Work function for one job type.

  Validate() throws util::InvalidConfig. Run() reports failure either by
  returning WorkResult::Failure or by throwing; work must poll the
  context's token at safe boundaries to honour cancellation.
*/
class JobHandler {
 public:
  virtual ~JobHandler() = default;

  virtual void       Validate(const google::protobuf::Struct& config) const = 0;
  virtual WorkResult Run(JobContext& context)                              = 0;
};

} // namespace jobhub::jobs
