#pragma once

#include <stdexcept>
#include <string>

namespace jobhub::util {

/*
  Central error types.

  NotFound / AlreadyExists / Conflict / InvalidConfig / InvalidRequest are
  raised synchronously to callers of the job manager. ExecutionFailure only
  lives inside a job's work function; the executor converts it into a
  failed execution record and never lets it escape.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidRequest : public std::runtime_error {
 public:
  explicit InvalidRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionFailure : public std::runtime_error {
 public:
  explicit ExecutionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace jobhub::util
