// Repository: simcore
// Component: Runtime Config
// Purpose: Step cadence, queue capacity and idempotency TTL settings.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_RUNTIME_RUNTIME_CONFIG_HPP_
#define SIMCORE_RUNTIME_RUNTIME_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

#include "simcore/command/CommandQueue.hpp"
#include "simcore/command/IdempotencyRegistry.hpp"

namespace simcore::runtime {

struct RuntimeConfig {
  int64_t step_size_ms = 100;
  int32_t max_steps_per_frame = 50;
  size_t max_command_queue_size = command::kDefaultMaxQueueSize;
  int64_t idempotency_ttl_ms = command::kDefaultIdempotencyTtlMs;
  int64_t initial_step = 0;

  // Defaults overridden by SIMCORE_STEP_SIZE_MS, SIMCORE_MAX_STEPS_PER_FRAME,
  // SIMCORE_MAX_COMMAND_QUEUE_SIZE and SIMCORE_IDEMPOTENCY_TTL_MS when set.
  // Throws std::invalid_argument on a value that is not an integer.
  static RuntimeConfig FromEnvironment();

  // Throws std::invalid_argument on non-positive sizes or a negative
  // initial step.
  void Validate() const;
};

}  // namespace simcore::runtime

#endif  // SIMCORE_RUNTIME_RUNTIME_CONFIG_HPP_
