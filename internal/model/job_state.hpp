#pragma once

#include <string_view>

#include "jobhub/manager/v1.hpp"

namespace jobhub::model {

using jobhub::manager::v1::ExecutionStatus;
using jobhub::manager::v1::JobState;
using jobhub::manager::v1::Trigger;
using jobhub::manager::v1::UpdateKind;

/*
  Job state machine:

    IDLE -> RUNNING -> IDLE                 (succeeded / failed)
            RUNNING -> CANCELLING -> IDLE   (cancelled)

  Forced runs may overlap, so RUNNING can be re-entered while active.
*/
constexpr bool IsActive(JobState state) {
  return state == jobhub::manager::v1::JOB_STATE_RUNNING || state == jobhub::manager::v1::JOB_STATE_CANCELLING;
}

constexpr bool IsTerminal(ExecutionStatus status) {
  return status == jobhub::manager::v1::EXECUTION_STATUS_SUCCEEDED || status == jobhub::manager::v1::EXECUTION_STATUS_FAILED ||
         status == jobhub::manager::v1::EXECUTION_STATUS_CANCELLED;
}

constexpr std::string_view StatusName(ExecutionStatus status) {
  switch (status) {
    case jobhub::manager::v1::EXECUTION_STATUS_RUNNING:
      return "running";
    case jobhub::manager::v1::EXECUTION_STATUS_SUCCEEDED:
      return "succeeded";
    case jobhub::manager::v1::EXECUTION_STATUS_FAILED:
      return "failed";
    case jobhub::manager::v1::EXECUTION_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

constexpr std::string_view StateName(JobState state) {
  switch (state) {
    case jobhub::manager::v1::JOB_STATE_RUNNING:
      return "running";
    case jobhub::manager::v1::JOB_STATE_CANCELLING:
      return "cancelling";
    default:
      return "idle";
  }
}

constexpr std::string_view TriggerName(Trigger trigger) {
  return trigger == jobhub::manager::v1::TRIGGER_SCHEDULED ? "scheduled" : "manual";
}

constexpr std::string_view UpdateKindName(UpdateKind kind) {
  switch (kind) {
    case jobhub::manager::v1::UPDATE_KIND_STARTED:
      return "started";
    case jobhub::manager::v1::UPDATE_KIND_PROGRESS:
      return "progress";
    case jobhub::manager::v1::UPDATE_KIND_COMPLETED:
      return "completed";
    case jobhub::manager::v1::UPDATE_KIND_FAILED:
      return "failed";
    case jobhub::manager::v1::UPDATE_KIND_CANCELLING:
      return "cancelling";
    case jobhub::manager::v1::UPDATE_KIND_CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

} // namespace jobhub::model
