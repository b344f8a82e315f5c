// Repository: simcore
// Component: Immutable Scalars
// Purpose: Read-only calendar and pattern matcher snapshots.
// Copyright (c) 2025 simcore

#include "simcore/snapshot/ImmutableScalars.hpp"

#include "simcore/snapshot/ImmutableValue.hpp"

namespace simcore::snapshot {

void ImmutableDate::SetTime(double) const { RejectMutation("date", "setTime"); }
void ImmutableDate::SetUtcFullYear(double) const { RejectMutation("date", "setUTCFullYear"); }
void ImmutableDate::SetUtcMonth(double) const { RejectMutation("date", "setUTCMonth"); }
void ImmutableDate::SetUtcDate(double) const { RejectMutation("date", "setUTCDate"); }
void ImmutableDate::SetUtcHours(double) const { RejectMutation("date", "setUTCHours"); }
void ImmutableDate::SetUtcMinutes(double) const { RejectMutation("date", "setUTCMinutes"); }
void ImmutableDate::SetUtcSeconds(double) const { RejectMutation("date", "setUTCSeconds"); }
void ImmutableDate::SetUtcMilliseconds(double) const {
  RejectMutation("date", "setUTCMilliseconds");
}

std::optional<payload::PatternMatch> ImmutablePattern::Exec(const std::string& input) const {
  const bool stateful = pattern_.Global() || pattern_.Sticky();
  return pattern_.MatchFrom(input, stateful ? pattern_.LastIndex() : 0);
}

payload::Pattern ImmutablePattern::ToPattern() const {
  return payload::Pattern(pattern_.Source(), pattern_.Flags());
}

void ImmutablePattern::SetLastIndex(size_t) const { RejectMutation("pattern", "set lastIndex"); }
void ImmutablePattern::Compile(const std::string&, const std::string&) const {
  RejectMutation("pattern", "compile");
}

}  // namespace simcore::snapshot
