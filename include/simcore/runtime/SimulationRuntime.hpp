// Repository: simcore
// Component: Simulation Runtime
// Purpose: Fixed-step driver that drains the command queue once per step.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_RUNTIME_SIMULATION_RUNTIME_HPP_
#define SIMCORE_RUNTIME_SIMULATION_RUNTIME_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "simcore/command/CommandDispatcher.hpp"
#include "simcore/command/CommandQueue.hpp"
#include "simcore/command/CommandRecorder.hpp"
#include "simcore/runtime/RuntimeConfig.hpp"
#include "simcore/telemetry/TelemetrySink.hpp"
#include "simcore/time/ITimeSource.hpp"

namespace simcore::runtime {

// Result of one drained command, kept until the transport boundary collects
// it with DrainCommandOutcomes().
struct CommandExecutionOutcome {
  std::string type;
  std::optional<std::string> request_id;
  int64_t server_step = 0;
  // Wall-clock time the result was settled; what the transport boundary
  // passes to IIdempotencyRegistry::Record.
  int64_t recorded_at_ms = 0;
  command::CommandResult result;
};

// =============================================================================
// SimulationRuntime
// Accumulates wall time and runs whole steps of step_size_ms, at most
// max_steps_per_frame per Tick(). Each step:
//   1. drains DequeueUpToStep(current_step)
//   2. skips commands stamped for an earlier step ("CommandStepMismatch")
//   3. executes the rest in drain order and records their outcomes
//   4. settles ready fire-and-forget work, records "queue" counters and a tick
// An attached CommandRecorder sees every command that reaches step 3.
// Single-threaded; owns its queue and dispatcher.
// =============================================================================

class SimulationRuntime : public command::IReplayTarget {
 public:
  // Throws std::invalid_argument if config.Validate() fails.
  explicit SimulationRuntime(
      RuntimeConfig config = RuntimeConfig(),
      std::shared_ptr<telemetry::ITelemetrySink> telemetry = nullptr,
      std::shared_ptr<command::IEventPublisher> event_publisher = nullptr,
      std::shared_ptr<time::ITimeSource> time_source = nullptr);

  SimulationRuntime(const SimulationRuntime&) = delete;
  SimulationRuntime& operator=(const SimulationRuntime&) = delete;

  command::CommandQueue& GetCommandQueue() override { return queue_; }
  command::CommandDispatcher& GetCommandDispatcher() { return dispatcher_; }
  const RuntimeConfig& config() const { return config_; }

  // Non-positive deltas are ignored. Throws std::invalid_argument for a
  // non-finite delta. Returns the number of steps run.
  int32_t Tick(double delta_ms);

  int64_t CurrentStep() const override { return current_step_; }
  // Step a command must carry to run on the next drain; while a step is
  // executing this is already the following step.
  int64_t NextExecutableStep() const override { return next_executable_step_; }
  // Used by replay; leaves the accumulated backlog untouched.
  void RestoreSteps(int64_t current_step, int64_t next_executable_step) override;

  // nullptr detaches.
  void SetCommandRecorder(std::shared_ptr<command::CommandRecorder> recorder);
  // Time accumulated but not yet consumed by a whole step.
  double BacklogMs() const { return accumulator_ms_; }

  std::vector<CommandExecutionOutcome> DrainCommandOutcomes();

 private:
  void RunStep();

  const RuntimeConfig config_;
  const std::shared_ptr<telemetry::ITelemetrySink> telemetry_;
  const std::shared_ptr<time::ITimeSource> time_source_;
  command::CommandQueue queue_;
  command::CommandDispatcher dispatcher_;
  std::shared_ptr<command::CommandRecorder> recorder_;

  double accumulator_ms_ = 0.0;
  int64_t current_step_ = 0;
  int64_t next_executable_step_ = 0;
  std::vector<CommandExecutionOutcome> outcomes_;
};

}  // namespace simcore::runtime

#endif  // SIMCORE_RUNTIME_SIMULATION_RUNTIME_HPP_
