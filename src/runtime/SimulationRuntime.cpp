// Repository: simcore
// Component: Simulation Runtime
// Purpose: Fixed-step driver that drains the command queue once per step.
// Copyright (c) 2025 simcore

#include "simcore/runtime/SimulationRuntime.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "simcore/time/SystemTimeSource.hpp"
#include "simcore/util/Logger.hpp"

namespace simcore::runtime {

namespace {

const RuntimeConfig& Validated(const RuntimeConfig& config) {
  config.Validate();
  return config;
}

}  // namespace

SimulationRuntime::SimulationRuntime(
    RuntimeConfig config, std::shared_ptr<telemetry::ITelemetrySink> telemetry,
    std::shared_ptr<command::IEventPublisher> event_publisher,
    std::shared_ptr<time::ITimeSource> time_source)
    : config_(Validated(config)),
      telemetry_(telemetry::OrNullTelemetry(std::move(telemetry))),
      time_source_(time_source ? std::move(time_source)
                               : std::make_shared<time::SystemTimeSource>()),
      queue_(config_.max_command_queue_size, telemetry_),
      dispatcher_(telemetry_),
      current_step_(config_.initial_step),
      next_executable_step_(config_.initial_step) {
  if (event_publisher) {
    dispatcher_.SetEventPublisher(std::move(event_publisher));
  }
  util::Logger::Debug("[SimulationRuntime] step_size_ms=" +
                      std::to_string(config_.step_size_ms) +
                      " max_steps_per_frame=" + std::to_string(config_.max_steps_per_frame) +
                      " max_command_queue_size=" +
                      std::to_string(config_.max_command_queue_size));
}

int32_t SimulationRuntime::Tick(double delta_ms) {
  if (!std::isfinite(delta_ms)) {
    throw std::invalid_argument("SimulationRuntime::Tick delta must be finite");
  }
  if (delta_ms <= 0) {
    return 0;
  }

  accumulator_ms_ += delta_ms;
  const auto step_size = static_cast<double>(config_.step_size_ms);
  const auto available = static_cast<int64_t>(std::floor(accumulator_ms_ / step_size));
  const auto steps = static_cast<int32_t>(
      std::min<int64_t>(available, static_cast<int64_t>(config_.max_steps_per_frame)));
  if (steps == 0) {
    return 0;
  }
  accumulator_ms_ -= steps * step_size;

  for (int32_t i = 0; i < steps; ++i) {
    RunStep();
  }
  return steps;
}

void SimulationRuntime::RunStep() {
  const size_t size_before = queue_.Size();

  next_executable_step_ = current_step_;
  std::vector<command::CommandSnapshot> commands = queue_.DequeueUpToStep(current_step_);
  // Commands enqueued by handlers during this step run on the next one.
  next_executable_step_ = current_step_ + 1;

  size_t executed = 0;
  size_t skipped = 0;
  for (const auto& command : commands) {
    if (command.step != current_step_) {
      ++skipped;
      telemetry_->RecordError("CommandStepMismatch",
                              {{"expectedStep", current_step_},
                               {"commandStep", command.step},
                               {"type", command.type}});
      continue;
    }

    CommandExecutionOutcome outcome;
    outcome.type = command.type;
    outcome.request_id = command.request_id;
    outcome.server_step = current_step_;
    if (recorder_) {
      recorder_->Record(command);
    }
    outcome.result = dispatcher_.ExecuteWithResult(command);
    outcome.recorded_at_ms = time_source_->NowUtcMs();
    outcomes_.push_back(std::move(outcome));
    ++executed;
  }

  dispatcher_.PollPending();

  telemetry_->RecordCounters("queue",
                             {{"sizeBefore", static_cast<double>(size_before)},
                              {"sizeAfter", static_cast<double>(queue_.Size())},
                              {"captured", static_cast<double>(commands.size())},
                              {"executed", static_cast<double>(executed)},
                              {"skipped", static_cast<double>(skipped)}});

  ++current_step_;
  next_executable_step_ = current_step_;
  telemetry_->RecordTick();
}

void SimulationRuntime::RestoreSteps(int64_t current_step, int64_t next_executable_step) {
  current_step_ = current_step;
  next_executable_step_ = next_executable_step;
}

void SimulationRuntime::SetCommandRecorder(std::shared_ptr<command::CommandRecorder> recorder) {
  recorder_ = std::move(recorder);
}

std::vector<CommandExecutionOutcome> SimulationRuntime::DrainCommandOutcomes() {
  std::vector<CommandExecutionOutcome> drained;
  drained.swap(outcomes_);
  return drained;
}

}  // namespace simcore::runtime
