// Repository: simcore
// Component: Snapshot Builder
// Purpose: Recursive payload-to-snapshot conversion with identity tracking.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_SNAPSHOT_SNAPSHOT_BUILDER_HPP_
#define SIMCORE_SNAPSHOT_SNAPSHOT_BUILDER_HPP_

#include <unordered_map>
#include <unordered_set>

#include "simcore/payload/Value.hpp"
#include "simcore/snapshot/ImmutableValue.hpp"

namespace simcore::snapshot {

// One builder per Snapshot() call. `seen_` maps a payload node to its
// finished snapshot node so shared references stay shared; `in_progress_`
// holds the current ancestry for cycle detection.
class SnapshotBuilder {
 public:
  ImmutableValue Build(const payload::Value& value);

 private:
  ImmutableValue BuildNode(const payload::Value& value);

  std::unordered_map<const void*, ImmutableValue> seen_;
  std::unordered_set<const void*> in_progress_;
};

}  // namespace simcore::snapshot

#endif  // SIMCORE_SNAPSHOT_SNAPSHOT_BUILDER_HPP_
