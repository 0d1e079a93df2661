#include "cron_expression.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <ctime>
#include <sstream>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace jobhub::schedule {

namespace {

constexpr std::time_t kMinute      = 60;
constexpr std::time_t kSearchLimit = 5 * 366 * 24 * 60 * 60;

constexpr std::array<std::string_view, 12> kMonthNames = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                                          "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
constexpr std::array<std::string_view, 7>  kDayNames   = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

struct FieldSpec {
  const char* name;
  int         min;
  int         max;
  // value written for names[i]; months are 1-based
  const std::string_view* names;
  std::size_t             name_count;
  int                     name_base;
};

std::string ExpandMacro(std::string_view expression) {
  static constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kMacros = {{
      {"@hourly", "0 * * * *"},
      {"@daily", "0 0 * * *"},
      {"@midnight", "0 0 * * *"},
      {"@weekly", "0 0 * * 0"},
      {"@monthly", "0 0 1 * *"},
      {"@yearly", "0 0 1 1 *"},
      {"@annually", "0 0 1 1 *"},
  }};
  for (const auto& [macro, expansion] : kMacros) {
    if (expression == macro) {
      return std::string(expansion);
    }
  }
  return std::string(expression);
}

[[noreturn]] void Fail(const FieldSpec& spec, std::string_view token, std::string_view reason) {
  throw util::InvalidConfig("invalid cron " + std::string(spec.name) + " field '" + std::string(token) + "': " + std::string(reason));
}

int ParseValue(const FieldSpec& spec, std::string_view token, std::string_view whole) {
  if (spec.names != nullptr && !token.empty() && std::isalpha(static_cast<unsigned char>(token.front()))) {
    std::string upper(token);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (std::size_t i = 0; i < spec.name_count; ++i) {
      if (spec.names[i] == upper) {
        return static_cast<int>(i) + spec.name_base;
      }
    }
    Fail(spec, whole, "unknown name");
  }

  int value = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc() || ptr != token.data() + token.size()) {
    Fail(spec, whole, "not a number");
  }
  if (value < spec.min || value > spec.max) {
    Fail(spec, whole, "out of range");
  }
  return value;
}

// Sets bits [min..max] of `out` (indexed by value) and reports whether the
// field started with '*'.
template <std::size_t N>
bool ParseField(std::string_view field, const FieldSpec& spec, std::bitset<N>& out, int index_offset = 0) {
  if (field.empty()) {
    Fail(spec, field, "empty");
  }

  const bool starred = field.front() == '*';

  std::size_t start = 0;
  while (start <= field.size()) {
    const auto  comma = field.find(',', start);
    const auto  item  = field.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    if (item.empty()) {
      Fail(spec, field, "empty list element");
    }

    auto range = item;
    int  step  = 1;
    if (const auto slash = item.find('/'); slash != std::string_view::npos) {
      range = item.substr(0, slash);
      const auto step_text = item.substr(slash + 1);
      auto [ptr, ec]       = std::from_chars(step_text.data(), step_text.data() + step_text.size(), step);
      if (ec != std::errc() || ptr != step_text.data() + step_text.size() || step <= 0 || step > spec.max - spec.min + 1) {
        Fail(spec, field, "bad step");
      }
    }

    int low  = spec.min;
    int high = spec.max;
    if (range != "*") {
      if (const auto dash = range.find('-'); dash != std::string_view::npos) {
        low  = ParseValue(spec, range.substr(0, dash), field);
        high = ParseValue(spec, range.substr(dash + 1), field);
        if (low > high) {
          Fail(spec, field, "descending range");
        }
      } else {
        low = ParseValue(spec, range, field);
        // "5/15" runs from 5 to the end of the field
        high = item.find('/') != std::string_view::npos ? spec.max : low;
      }
    }

    for (int v = low; v <= high; v += step) {
      out.set(static_cast<std::size_t>(v - index_offset));
    }

    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }

  return starred;
}

std::time_t ToTimeT(util::TimePoint tp) {
  return util::Clock::to_time_t(tp);
}

} // namespace

CronExpression CronExpression::Parse(std::string_view expression) {
  const auto expanded = ExpandMacro(expression);

  std::vector<std::string> fields;
  std::istringstream       in(expanded);
  for (std::string field; in >> field;) {
    fields.push_back(field);
  }
  if (fields.size() != 5) {
    throw util::InvalidConfig("cron expression '" + std::string(expression) + "' must have 5 fields, got " + std::to_string(fields.size()));
  }

  static const FieldSpec kMinuteSpec{"minute", 0, 59, nullptr, 0, 0};
  static const FieldSpec kHourSpec{"hour", 0, 23, nullptr, 0, 0};
  static const FieldSpec kDomSpec{"day-of-month", 1, 31, nullptr, 0, 0};
  static const FieldSpec kMonthSpec{"month", 1, 12, kMonthNames.data(), kMonthNames.size(), 1};
  static const FieldSpec kDowSpec{"day-of-week", 0, 7, kDayNames.data(), kDayNames.size(), 0};

  CronExpression cron;

  ParseField(fields[0], kMinuteSpec, cron.minutes_);
  ParseField(fields[1], kHourSpec, cron.hours_);
  cron.dom_restricted_ = !ParseField(fields[2], kDomSpec, cron.days_of_month_);
  ParseField(fields[3], kMonthSpec, cron.months_, 1);

  std::bitset<8> dow;
  cron.dow_restricted_ = !ParseField(fields[4], kDowSpec, dow);
  for (std::size_t d = 0; d < 7; ++d) {
    cron.days_of_week_[d] = dow[d];
  }
  if (dow[7]) {
    cron.days_of_week_.set(0);
  }

  return cron;
}

bool CronExpression::DayMatches(int mday, int mon, int wday) const {
  if (!months_[static_cast<std::size_t>(mon)]) {
    return false;
  }

  const bool dom = days_of_month_[static_cast<std::size_t>(mday)];
  const bool dow = days_of_week_[static_cast<std::size_t>(wday)];
  if (dom_restricted_ && dow_restricted_) {
    return dom || dow;
  }
  if (dom_restricted_) {
    return dom;
  }
  if (dow_restricted_) {
    return dow;
  }
  return true;
}

std::optional<util::TimePoint> CronExpression::Next(util::TimePoint after) const {
  const std::time_t origin = ToTimeT(after);
  std::time_t       t      = origin - (origin % kMinute) + kMinute;
  const std::time_t limit  = origin + kSearchLimit;

  std::tm tm{};
  while (t <= limit) {
    gmtime_r(&t, &tm);

    if (!DayMatches(tm.tm_mday, tm.tm_mon, tm.tm_wday)) {
      tm.tm_mday += 1;
      tm.tm_hour = 0;
      tm.tm_min  = 0;
      tm.tm_sec  = 0;
      t          = timegm(&tm);
      continue;
    }
    if (!hours_[static_cast<std::size_t>(tm.tm_hour)]) {
      tm.tm_hour += 1;
      tm.tm_min = 0;
      tm.tm_sec = 0;
      t         = timegm(&tm);
      continue;
    }
    if (!minutes_[static_cast<std::size_t>(tm.tm_min)]) {
      t += kMinute;
      continue;
    }
    return util::Clock::from_time_t(t);
  }
  return std::nullopt;
}

} // namespace jobhub::schedule
