#include "schedule.hpp"

#include <chrono>
#include <string>

#include "internal/schedule/cron_expression.hpp"
#include "internal/util/errors.hpp"

namespace jobhub::schedule {

using namespace jobhub::manager::v1;

void ValidateSchedule(const Schedule& schedule) {
  switch (schedule.type()) {
    case SCHEDULE_TYPE_UNSPECIFIED:
    case SCHEDULE_TYPE_MANUAL:
    case SCHEDULE_TYPE_STARTUP:
      return;
    case SCHEDULE_TYPE_INTERVAL:
      if (schedule.interval_seconds() == 0) {
        throw util::InvalidConfig("interval schedule requires interval_seconds > 0");
      }
      return;
    case SCHEDULE_TYPE_CRON:
      if (schedule.cron_expression().empty()) {
        throw util::InvalidConfig("cron schedule requires cron_expression");
      }
      CronExpression::Parse(schedule.cron_expression());
      return;
    default:
      throw util::InvalidConfig("unknown schedule type " + std::to_string(static_cast<int>(schedule.type())));
  }
}

std::optional<util::TimePoint> ComputeNextRun(const Schedule& schedule, bool enabled, util::TimePoint reference, bool after_execution) {
  if (!enabled) {
    return std::nullopt;
  }

  switch (schedule.type()) {
    case SCHEDULE_TYPE_INTERVAL:
      if (schedule.interval_seconds() == 0) {
        return std::nullopt;
      }
      return reference + std::chrono::seconds(schedule.interval_seconds());
    case SCHEDULE_TYPE_CRON:
      return CronExpression::Parse(schedule.cron_expression()).Next(reference);
    case SCHEDULE_TYPE_STARTUP:
      if (after_execution) {
        return std::nullopt;
      }
      return reference;
    default:
      return std::nullopt;
  }
}

} // namespace jobhub::schedule
