#pragma once

#include <optional>

#include "internal/util/time.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::schedule {

// Throws util::InvalidConfig when the schedule cannot produce run times.
void ValidateSchedule(const jobhub::manager::v1::Schedule& schedule);

/*
  Next due time of a job.

  reference        -> completion time after an execution, Start() time or
                      the time of the definition change otherwise
  after_execution  -> true when called because an execution just settled

  Returns nullopt for manual schedules, disabled jobs, startup schedules
  after their run and cron expressions without a match.
*/
std::optional<util::TimePoint> ComputeNextRun(const jobhub::manager::v1::Schedule& schedule, bool enabled, util::TimePoint reference,
                                              bool after_execution);

} // namespace jobhub::schedule
