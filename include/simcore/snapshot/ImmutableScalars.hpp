// Repository: simcore
// Component: Immutable Scalars
// Purpose: Read-only calendar and pattern matcher snapshots.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_SNAPSHOT_IMMUTABLE_SCALARS_HPP_
#define SIMCORE_SNAPSHOT_IMMUTABLE_SCALARS_HPP_

#include <optional>
#include <string>
#include <utility>

#include "simcore/payload/Date.hpp"
#include "simcore/payload/Pattern.hpp"
#include "simcore/snapshot/ImmutableValue.hpp"

namespace simcore::snapshot {

class ImmutableDate {
 public:
  ImmutableDate(SnapshotKey, payload::Date date) : ImmutableDate(std::move(date)) {}

  bool IsValid() const { return date_.IsValid(); }
  double GetTime() const { return date_.GetTime(); }
  double ValueOf() const { return date_.GetTime(); }

  double GetUtcFullYear() const { return date_.GetUtcFullYear(); }
  double GetUtcMonth() const { return date_.GetUtcMonth(); }
  double GetUtcDate() const { return date_.GetUtcDate(); }
  double GetUtcDay() const { return date_.GetUtcDay(); }
  double GetUtcHours() const { return date_.GetUtcHours(); }
  double GetUtcMinutes() const { return date_.GetUtcMinutes(); }
  double GetUtcSeconds() const { return date_.GetUtcSeconds(); }
  double GetUtcMilliseconds() const { return date_.GetUtcMilliseconds(); }
  std::string ToIsoString() const { return date_.ToIsoString(); }

  // Independent mutable copy.
  payload::Date ToDate() const { return date_; }

  [[noreturn]] void SetTime(double epoch_ms) const;
  [[noreturn]] void SetUtcFullYear(double year) const;
  [[noreturn]] void SetUtcMonth(double month) const;
  [[noreturn]] void SetUtcDate(double day) const;
  [[noreturn]] void SetUtcHours(double hours) const;
  [[noreturn]] void SetUtcMinutes(double minutes) const;
  [[noreturn]] void SetUtcSeconds(double seconds) const;
  [[noreturn]] void SetUtcMilliseconds(double ms) const;

 private:
  friend class SnapshotBuilder;
  explicit ImmutableDate(payload::Date date) : date_(std::move(date)) {}

  payload::Date date_;
};

// Exec and Test run from the frozen LastIndex() and never advance it.
class ImmutablePattern {
 public:
  ImmutablePattern(SnapshotKey, payload::Pattern pattern)
      : ImmutablePattern(std::move(pattern)) {}

  const std::string& Source() const { return pattern_.Source(); }
  const std::string& Flags() const { return pattern_.Flags(); }
  bool Global() const { return pattern_.Global(); }
  bool IgnoreCase() const { return pattern_.IgnoreCase(); }
  bool Multiline() const { return pattern_.Multiline(); }
  bool Sticky() const { return pattern_.Sticky(); }
  size_t LastIndex() const { return pattern_.LastIndex(); }

  std::optional<payload::PatternMatch> Exec(const std::string& input) const;
  bool Test(const std::string& input) const { return Exec(input).has_value(); }

  // Independent mutable copy with LastIndex() reset.
  payload::Pattern ToPattern() const;

  [[noreturn]] void SetLastIndex(size_t index) const;
  [[noreturn]] void Compile(const std::string& source,
                            const std::string& flags = "") const;

 private:
  friend class SnapshotBuilder;
  explicit ImmutablePattern(payload::Pattern pattern) : pattern_(std::move(pattern)) {}

  payload::Pattern pattern_;
};

}  // namespace simcore::snapshot

#endif  // SIMCORE_SNAPSHOT_IMMUTABLE_SCALARS_HPP_
