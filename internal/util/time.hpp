#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace jobhub::util {

/*
  Time utilities. All job timestamps are UTC wall-clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// An all-zero Timestamp means "absent" throughout the job model.
bool IsSet(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 in UTC with second precision, e.g. 2025-01-31T12:00:00Z.
std::string FormatRfc3339(TimePoint tp);

} // namespace jobhub::util
