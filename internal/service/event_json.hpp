#pragma once

#include <string>

#include "jobhub/manager/v1.hpp"

namespace jobhub::service {

/*
  Text rendering of one event-stream element:

    {"type":"connected","timestamp":"..."}
    {"type":"job_update","jobId":"..","executionId":"..","status":"started",
     "message":"..","timestamp":"..."}
    {"type":"ping","timestamp":"..."}

  Timestamps are RFC 3339 UTC.
*/
std::string EncodeEventJson(const jobhub::manager::v1::JobEvent& event);

} // namespace jobhub::service
