#pragma once

#include <bitset>
#include <optional>
#include <string_view>

#include "internal/util/time.hpp"

namespace jobhub::schedule {

/*
  Five-field cron expression evaluated in UTC.

    minute hour day-of-month month day-of-week

  Each field accepts '*', numbers, 'a-b' ranges, comma lists and '/step'.
  Month and weekday fields also take three-letter names (JAN, MON).
  Day-of-week 7 is Sunday, same as 0. When both day fields are restricted
  a day matches if either one does.

  The @hourly, @daily, @midnight, @weekly, @monthly, @yearly and
  @annually shorthands are expanded before parsing.
*/
class CronExpression {
 public:
  // Throws util::InvalidConfig with the offending field on a bad expression.
  static CronExpression Parse(std::string_view expression);

  // First matching minute strictly after `after`, or nullopt when nothing
  // matches within five years (e.g. "0 0 30 2 *").
  std::optional<util::TimePoint> Next(util::TimePoint after) const;

 private:
  CronExpression() = default;

  bool DayMatches(int mday, int mon, int wday) const;

  std::bitset<60> minutes_;
  std::bitset<24> hours_;
  std::bitset<32> days_of_month_; // index 1..31
  std::bitset<12> months_;        // index 0..11
  std::bitset<7>  days_of_week_;  // 0 = Sunday

  bool dom_restricted_{false};
  bool dow_restricted_{false};
};

} // namespace jobhub::schedule
