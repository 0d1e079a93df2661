#include <assert.h>

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/jobs/cancellation.hpp"
#include "internal/jobs/command_handler.hpp"
#include "internal/util/errors.hpp"
#include "jobhub/manager/v1.hpp"

namespace {

using jobhub::jobs::CancellationToken;
using jobhub::jobs::CommandHandler;
using jobhub::jobs::JobContext;
using jobhub::jobs::WorkResult;
using jobhub::manager::v1::Job;

Job ShellJob(const std::string& script) {
  Job job;
  job.set_id("cmd");
  job.set_name("Command");
  job.set_type("command");
  auto& fields = *job.mutable_config()->mutable_fields();
  fields["command"].set_string_value("sh");
  auto* args = fields["arguments"].mutable_list_value();
  args->add_values()->set_string_value("-c");
  args->add_values()->set_string_value(script);
  return job;
}

WorkResult RunJob(const Job& job, std::shared_ptr<CancellationToken> token = std::make_shared<CancellationToken>()) {
  CommandHandler handler;
  handler.Validate(job.config());
  JobContext context(job, "exec-1", token, nullptr);
  return handler.Run(context);
}

bool Rejects(const google::protobuf::Struct& config) {
  try {
    CommandHandler().Validate(config);
  } catch (const jobhub::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestCapturesCombinedOutput() {
  auto result = RunJob(ShellJob("echo hello; echo oops 1>&2"));
  assert(result.succeeded);
  assert(result.exit_code == 0);
  assert(result.output.find("hello") != std::string::npos);
  assert(result.output.find("oops") != std::string::npos);
}

void TestNonZeroExitFails() {
  auto result = RunJob(ShellJob("exit 3"));
  assert(!result.succeeded);
  assert(result.error == "exit status 3");
  assert(result.exit_code == 3);
}

void TestEnvironmentAndWorkingDir() {
  const auto dir = std::filesystem::temp_directory_path() / "jobhub_command_handler_test";
  std::filesystem::create_directories(dir);

  auto  job    = ShellJob("printf '%s:' \"$JOBHUB_TEST_VALUE\"; pwd");
  auto& fields = *job.mutable_config()->mutable_fields();
  fields["working_dir"].set_string_value(dir.string());
  (*fields["environment"].mutable_struct_value()->mutable_fields())["JOBHUB_TEST_VALUE"].set_string_value("forty-two");

  auto result = RunJob(job);
  assert(result.succeeded);
  assert(result.output.rfind("forty-two:", 0) == 0);
  assert(result.output.find(std::filesystem::canonical(dir).string()) != std::string::npos);
}

void TestCancellationTerminatesProcess() {
  auto token = std::make_shared<CancellationToken>();

  std::thread canceller([token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    token->Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  auto       result  = RunJob(ShellJob("sleep 30"), token);
  canceller.join();

  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
  assert(!result.succeeded);
  assert(result.error == "terminated by signal 15");
  assert(result.exit_code == -1);
}

void TestOutputIsBounded() {
  auto result = RunJob(ShellJob("head -c 200000 /dev/zero | tr '\\0' x"));
  assert(result.succeeded);
  assert(result.output.size() <= CommandHandler::kMaxOutputBytes + 32);
  assert(result.output.find("[output truncated]") != std::string::npos);
}

void TestMissingProgramFails() {
  Job job;
  (*job.mutable_config()->mutable_fields())["command"].set_string_value("jobhub-definitely-not-installed");
  auto result = RunJob(job);
  assert(!result.succeeded);
  assert(result.exit_code == 127);
}

void TestValidationRejectsBadConfig() {
  google::protobuf::Struct empty;
  assert(Rejects(empty));

  google::protobuf::Struct unknown;
  (*unknown.mutable_fields())["command"].set_string_value("true");
  (*unknown.mutable_fields())["retries"].set_number_value(3);
  assert(Rejects(unknown));

  google::protobuf::Struct bad_args;
  (*bad_args.mutable_fields())["command"].set_string_value("true");
  (*bad_args.mutable_fields())["arguments"].set_string_value("-v");
  assert(Rejects(bad_args));

  google::protobuf::Struct bad_env;
  (*bad_env.mutable_fields())["command"].set_string_value("true");
  auto& env = (*(*bad_env.mutable_fields())["environment"].mutable_struct_value()->mutable_fields())["JOBHUB_MODE"];
  env.mutable_list_value()->add_values()->set_string_value("fast");
  std::string message;
  try {
    CommandHandler().Validate(bad_env);
  } catch (const jobhub::util::InvalidConfig& e) {
    message = e.what();
  }
  assert(message.find("environment.JOBHUB_MODE") != std::string::npos);

  google::protobuf::Struct good;
  (*good.mutable_fields())["command"].set_string_value("true");
  (*good.mutable_fields())["arguments"].mutable_list_value()->add_values()->set_number_value(7);
  assert(!Rejects(good));
}

} // namespace

int main() {
  TestCapturesCombinedOutput();
  TestNonZeroExitFails();
  TestEnvironmentAndWorkingDir();
  TestCancellationTerminatesProcess();
  TestOutputIsBounded();
  TestMissingProgramFails();
  TestValidationRejectsBadConfig();

  std::cout << "jobhub_unit_command_handler: pass\n";
  return 0;
}
