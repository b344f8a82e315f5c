// Repository: simcore
// Component: Payload Date
// Purpose: UTC calendar value backed by epoch milliseconds.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_PAYLOAD_DATE_HPP_
#define SIMCORE_PAYLOAD_DATE_HPP_

#include <string>

namespace simcore::payload {

// Calendar value with millisecond precision in the range +/-8.64e15 ms around
// the epoch. Out-of-range or NaN times make the date invalid; getters then
// return NaN. Setters normalize overflowing fields (month 12 rolls the year).
class Date {
 public:
  static constexpr double kMaxTimeMs = 8.64e15;

  explicit Date(double epoch_ms);

  // month is zero-based.
  static Date FromUtc(double year, double month, double day = 1, double hours = 0,
                      double minutes = 0, double seconds = 0, double ms = 0);

  bool IsValid() const;
  double GetTime() const { return time_ms_; }

  double GetUtcFullYear() const;
  double GetUtcMonth() const;
  double GetUtcDate() const;
  double GetUtcDay() const;
  double GetUtcHours() const;
  double GetUtcMinutes() const;
  double GetUtcSeconds() const;
  double GetUtcMilliseconds() const;

  // YYYY-MM-DDTHH:mm:ss.sssZ. Throws std::range_error for an invalid date.
  std::string ToIsoString() const;

  void SetTime(double epoch_ms);
  void SetUtcFullYear(double year);
  void SetUtcMonth(double month);
  void SetUtcDate(double day);
  void SetUtcHours(double hours);
  void SetUtcMinutes(double minutes);
  void SetUtcSeconds(double seconds);
  void SetUtcMilliseconds(double ms);

 private:
  struct Fields {
    double year, month, day, hours, minutes, seconds, ms;
  };

  Fields Decompose() const;
  void Compose(const Fields& fields);

  double time_ms_;
};

}  // namespace simcore::payload

#endif  // SIMCORE_PAYLOAD_DATE_HPP_
