// Repository: simcore
// Component: Immutable Snapshot Engine
// Purpose: Converts a payload value graph into a deeply read-only equivalent.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_SNAPSHOT_SNAPSHOT_HPP_
#define SIMCORE_SNAPSHOT_SNAPSHOT_HPP_

#include "simcore/payload/Value.hpp"
#include "simcore/snapshot/ImmutableBuffers.hpp"
#include "simcore/snapshot/ImmutableContainers.hpp"
#include "simcore/snapshot/ImmutableScalars.hpp"
#include "simcore/snapshot/ImmutableValue.hpp"

namespace simcore::snapshot {

// Deep, structural, read-only copy of `value`. Nodes reachable through more
// than one path map to a single snapshot node. Later writes to `value` are
// not observed.
//
// Throws std::invalid_argument if the graph contains a cycle.
ImmutableValue Snapshot(const payload::Value& value);

}  // namespace simcore::snapshot

#endif  // SIMCORE_SNAPSHOT_SNAPSHOT_HPP_
