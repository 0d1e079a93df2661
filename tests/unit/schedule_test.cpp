#include <assert.h>

#include <ctime>
#include <iostream>
#include <string>

#include "internal/schedule/cron_expression.hpp"
#include "internal/schedule/schedule.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "jobhub/manager/v1.hpp"

namespace {

using jobhub::schedule::ComputeNextRun;
using jobhub::schedule::CronExpression;
using jobhub::util::TimePoint;
using namespace jobhub::manager::v1;

TimePoint Utc(int year, int month, int day, int hour, int minute, int second = 0) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;
  return jobhub::util::Clock::from_time_t(timegm(&tm));
}

TimePoint NextOf(const std::string& expression, TimePoint after) {
  auto next = CronExpression::Parse(expression).Next(after);
  assert(next.has_value());
  return *next;
}

bool Rejected(const std::string& expression) {
  try {
    CronExpression::Parse(expression);
  } catch (const jobhub::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestCronNextMatches() {
  assert(NextOf("*/15 * * * *", Utc(2025, 1, 1, 10, 7)) == Utc(2025, 1, 1, 10, 15));
  assert(NextOf("0 9 * * MON-FRI", Utc(2025, 1, 4, 12, 0)) == Utc(2025, 1, 6, 9, 0));
  assert(NextOf("0 0 1 * *", Utc(2025, 1, 31, 8, 0)) == Utc(2025, 2, 1, 0, 0));
  assert(NextOf("0 0 * * 7", Utc(2025, 1, 1, 0, 0)) == Utc(2025, 1, 5, 0, 0));
  assert(NextOf("0 12 * JUN *", Utc(2025, 1, 1, 0, 0)) == Utc(2025, 6, 1, 12, 0));
  assert(NextOf("@daily", Utc(2025, 1, 1, 10, 0)) == Utc(2025, 1, 2, 0, 0));
  assert(NextOf("0 0,12 * * *", Utc(2025, 1, 1, 0, 0)) == Utc(2025, 1, 1, 12, 0));
}

void TestCronIsStrictlyAfterReference() {
  assert(NextOf("30 10 * * *", Utc(2025, 1, 1, 10, 30)) == Utc(2025, 1, 2, 10, 30));
  assert(NextOf("30 10 * * *", Utc(2025, 1, 1, 10, 29, 59)) == Utc(2025, 1, 1, 10, 30));
}

void TestCronDayFieldsUseEither() {
  // the 13th or any Friday; Jan 3 2025 is a Friday
  assert(NextOf("0 0 13 * 5", Utc(2025, 1, 1, 0, 0)) == Utc(2025, 1, 3, 0, 0));
  assert(NextOf("0 0 13 * 5", Utc(2025, 1, 10, 1, 0)) == Utc(2025, 1, 13, 0, 0));
}

void TestCronWithoutMatch() {
  assert(!CronExpression::Parse("0 0 30 2 *").Next(Utc(2025, 1, 1, 0, 0)).has_value());
}

void TestCronRejectsBadExpressions() {
  assert(Rejected(""));
  assert(Rejected("* * * *"));
  assert(Rejected("* * * * * *"));
  assert(Rejected("60 * * * *"));
  assert(Rejected("*/0 * * * *"));
  assert(Rejected("5-1 * * * *"));
  assert(Rejected("0 0 * JANX *"));
  assert(Rejected("0 0 0 * *"));
  assert(Rejected("1/2147483647 * * * *"));
  assert(Rejected("0 0 */2147483647 * *"));
  assert(Rejected("0 0 * * */9"));
  assert(!Rejected("*/60 * * * *"));
  assert(NextOf("*/60 * * * *", Utc(2025, 1, 1, 10, 7)) == Utc(2025, 1, 1, 11, 0));
}

void TestComputeNextRun() {
  const auto reference = Utc(2025, 3, 1, 12, 0);

  Schedule interval;
  interval.set_type(SCHEDULE_TYPE_INTERVAL);
  interval.set_interval_seconds(600);
  assert(*ComputeNextRun(interval, true, reference, true) == Utc(2025, 3, 1, 12, 10));
  assert(!ComputeNextRun(interval, false, reference, true).has_value());

  Schedule manual;
  manual.set_type(SCHEDULE_TYPE_MANUAL);
  assert(!ComputeNextRun(manual, true, reference, false).has_value());

  Schedule startup;
  startup.set_type(SCHEDULE_TYPE_STARTUP);
  assert(*ComputeNextRun(startup, true, reference, false) == reference);
  assert(!ComputeNextRun(startup, true, reference, true).has_value());

  Schedule cron;
  cron.set_type(SCHEDULE_TYPE_CRON);
  cron.set_cron_expression("@hourly");
  assert(*ComputeNextRun(cron, true, reference, false) == Utc(2025, 3, 1, 13, 0));
}

void TestValidateSchedule() {
  Schedule interval;
  interval.set_type(SCHEDULE_TYPE_INTERVAL);

  bool threw = false;
  try {
    jobhub::schedule::ValidateSchedule(interval);
  } catch (const jobhub::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw && "interval schedules need a period");

  Schedule cron;
  cron.set_type(SCHEDULE_TYPE_CRON);
  cron.set_cron_expression("not a cron");
  threw = false;
  try {
    jobhub::schedule::ValidateSchedule(cron);
  } catch (const jobhub::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);

  cron.set_cron_expression("1/2147483647 * * * *");
  threw = false;
  try {
    jobhub::schedule::ValidateSchedule(cron);
  } catch (const jobhub::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw && "oversized step is a config error");
}

} // namespace

int main() {
  TestCronNextMatches();
  TestCronIsStrictlyAfterReference();
  TestCronDayFieldsUseEither();
  TestCronWithoutMatch();
  TestCronRejectsBadExpressions();
  TestComputeNextRun();
  TestValidateSchedule();

  std::cout << "jobhub_unit_schedule: pass\n";
  return 0;
}
