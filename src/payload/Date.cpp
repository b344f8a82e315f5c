// Repository: simcore
// Component: Payload Date
// Purpose: UTC calendar value backed by epoch milliseconds.
// Copyright (c) 2025 simcore

#include "simcore/payload/Date.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace simcore::payload {

namespace {

constexpr double kMsPerDay = 86400000.0;
constexpr double kMsPerHour = 3600000.0;
constexpr double kMsPerMinute = 60000.0;
constexpr double kMsPerSecond = 1000.0;
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Years outside this window cannot produce a clip-able time.
constexpr double kMaxYearMagnitude = 400000.0;

// Days since 1970-01-01 for a proleptic Gregorian civil date (month 1..12).
int64_t DaysFromCivil(int64_t y, int64_t m, int64_t d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

void CivilFromDays(int64_t z, int64_t& y, int64_t& m, int64_t& d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

double TimeClip(double t) {
  if (!std::isfinite(t) || std::fabs(t) > Date::kMaxTimeMs) return kNaN;
  return std::trunc(t) + 0.0;
}

}  // namespace

Date::Date(double epoch_ms) : time_ms_(TimeClip(epoch_ms)) {}

Date Date::FromUtc(double year, double month, double day, double hours,
                   double minutes, double seconds, double ms) {
  Date date(kNaN);
  date.Compose(Fields{year, month, day, hours, minutes, seconds, ms});
  return date;
}

bool Date::IsValid() const { return !std::isnan(time_ms_); }

Date::Fields Date::Decompose() const {
  const double days = std::floor(time_ms_ / kMsPerDay);
  double in_day = time_ms_ - days * kMsPerDay;
  int64_t y = 0, m = 0, d = 0;
  CivilFromDays(static_cast<int64_t>(days), y, m, d);
  Fields fields{};
  fields.year = static_cast<double>(y);
  fields.month = static_cast<double>(m - 1);
  fields.day = static_cast<double>(d);
  fields.hours = std::floor(in_day / kMsPerHour);
  in_day -= fields.hours * kMsPerHour;
  fields.minutes = std::floor(in_day / kMsPerMinute);
  in_day -= fields.minutes * kMsPerMinute;
  fields.seconds = std::floor(in_day / kMsPerSecond);
  fields.ms = in_day - fields.seconds * kMsPerSecond;
  return fields;
}

void Date::Compose(const Fields& f) {
  for (double field : {f.year, f.month, f.day, f.hours, f.minutes, f.seconds, f.ms}) {
    if (!std::isfinite(field)) {
      time_ms_ = kNaN;
      return;
    }
  }
  const double month = std::trunc(f.month);
  const double year = std::trunc(f.year) + std::floor(month / 12.0);
  const double month_in_year = month - std::floor(month / 12.0) * 12.0;
  if (std::fabs(year) > kMaxYearMagnitude) {
    time_ms_ = kNaN;
    return;
  }
  const double days =
      static_cast<double>(DaysFromCivil(static_cast<int64_t>(year),
                                        static_cast<int64_t>(month_in_year) + 1, 1)) +
      std::trunc(f.day) - 1.0;
  const double time = std::trunc(f.hours) * kMsPerHour +
                      std::trunc(f.minutes) * kMsPerMinute +
                      std::trunc(f.seconds) * kMsPerSecond + std::trunc(f.ms);
  time_ms_ = TimeClip(days * kMsPerDay + time);
}

double Date::GetUtcFullYear() const { return IsValid() ? Decompose().year : kNaN; }
double Date::GetUtcMonth() const { return IsValid() ? Decompose().month : kNaN; }
double Date::GetUtcDate() const { return IsValid() ? Decompose().day : kNaN; }
double Date::GetUtcHours() const { return IsValid() ? Decompose().hours : kNaN; }
double Date::GetUtcMinutes() const { return IsValid() ? Decompose().minutes : kNaN; }
double Date::GetUtcSeconds() const { return IsValid() ? Decompose().seconds : kNaN; }
double Date::GetUtcMilliseconds() const { return IsValid() ? Decompose().ms : kNaN; }

double Date::GetUtcDay() const {
  if (!IsValid()) return kNaN;
  // 1970-01-01 was a Thursday.
  const double days = std::floor(time_ms_ / kMsPerDay);
  double weekday = std::fmod(days + 4.0, 7.0);
  if (weekday < 0) weekday += 7.0;
  return weekday;
}

std::string Date::ToIsoString() const {
  if (!IsValid()) {
    throw std::range_error("Invalid time value");
  }
  const Fields f = Decompose();
  const auto year = static_cast<long long>(f.year);
  char buffer[40];
  if (year >= 0 && year <= 9999) {
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02d-%02dT%02d:%02d:%02d.%03dZ", year,
                  static_cast<int>(f.month) + 1, static_cast<int>(f.day),
                  static_cast<int>(f.hours), static_cast<int>(f.minutes),
                  static_cast<int>(f.seconds), static_cast<int>(f.ms));
  } else {
    std::snprintf(buffer, sizeof(buffer), "%c%06lld-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  year < 0 ? '-' : '+', year < 0 ? -year : year,
                  static_cast<int>(f.month) + 1, static_cast<int>(f.day),
                  static_cast<int>(f.hours), static_cast<int>(f.minutes),
                  static_cast<int>(f.seconds), static_cast<int>(f.ms));
  }
  return buffer;
}

void Date::SetTime(double epoch_ms) { time_ms_ = TimeClip(epoch_ms); }

void Date::SetUtcFullYear(double year) {
  // An invalid date restarts from the epoch when the year is set.
  Fields f = IsValid() ? Decompose() : Date(0).Decompose();
  f.year = year;
  Compose(f);
}

void Date::SetUtcMonth(double month) {
  if (!IsValid()) return;
  Fields f = Decompose();
  f.month = month;
  Compose(f);
}

void Date::SetUtcDate(double day) {
  if (!IsValid()) return;
  Fields f = Decompose();
  f.day = day;
  Compose(f);
}

void Date::SetUtcHours(double hours) {
  if (!IsValid()) return;
  Fields f = Decompose();
  f.hours = hours;
  Compose(f);
}

void Date::SetUtcMinutes(double minutes) {
  if (!IsValid()) return;
  Fields f = Decompose();
  f.minutes = minutes;
  Compose(f);
}

void Date::SetUtcSeconds(double seconds) {
  if (!IsValid()) return;
  Fields f = Decompose();
  f.seconds = seconds;
  Compose(f);
}

void Date::SetUtcMilliseconds(double ms) {
  if (!IsValid()) return;
  Fields f = Decompose();
  f.ms = ms;
  Compose(f);
}

}  // namespace simcore::payload
