#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "internal/jobs/job_handler.hpp"

namespace jobhub::jobs {

/*
  Runs an external process.

  config:
    command      string, required; resolved through PATH
    arguments    list of strings (numbers are formatted)
    working_dir  string
    environment  map of string -> string added to the inherited environment

  stdout and stderr are captured together, bounded by kMaxOutputBytes.
  On cancellation the process group receives SIGTERM and, after the grace
  period, SIGKILL.
*/
class CommandHandler final : public JobHandler {
 public:
  static constexpr std::size_t               kMaxOutputBytes = 64 * 1024;
  static constexpr std::chrono::milliseconds kPollInterval{100};
  static constexpr std::chrono::seconds      kKillGracePeriod{5};

  void       Validate(const google::protobuf::Struct& config) const override;
  WorkResult Run(JobContext& context) override;

 private:
  struct Invocation {
    std::string                        command;
    std::vector<std::string>           arguments;
    std::string                        working_dir;
    std::map<std::string, std::string> environment;
  };

  static Invocation Parse(const google::protobuf::Struct& config);
};

} // namespace jobhub::jobs
