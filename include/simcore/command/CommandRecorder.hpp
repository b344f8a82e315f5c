// Repository: simcore
// Component: Command Recorder
// Purpose: Records admitted commands and replays them through a dispatcher.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_COMMAND_COMMAND_RECORDER_HPP_
#define SIMCORE_COMMAND_COMMAND_RECORDER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "simcore/command/Command.hpp"
#include "simcore/command/CommandDispatcher.hpp"
#include "simcore/command/CommandQueue.hpp"
#include "simcore/payload/Value.hpp"
#include "simcore/snapshot/ImmutableValue.hpp"
#include "simcore/telemetry/TelemetrySink.hpp"
#include "simcore/time/ITimeSource.hpp"

namespace simcore::command {

inline constexpr const char* kCommandLogVersion = "0.1.0";

// Replay input: the state the recording started from plus every recorded
// command in execution order.
struct CommandLog {
  std::string version = kCommandLogVersion;
  snapshot::ImmutableValue start_state;
  std::vector<CommandSnapshot> commands;
  int64_t recorded_at_ms = 0;
  std::optional<uint64_t> seed;
  // Highest recorded step; -1 when nothing was recorded.
  int64_t last_step = -1;
};

// Runtime hooks for Replay(). SimulationRuntime implements it.
class IReplayTarget {
 public:
  virtual ~IReplayTarget() = default;

  virtual CommandQueue& GetCommandQueue() = 0;
  virtual int64_t CurrentStep() const = 0;
  virtual int64_t NextExecutableStep() const = 0;
  virtual void RestoreSteps(int64_t current_step, int64_t next_executable_step) = 0;
};

struct ReplayResult {
  size_t executed = 0;
  // Unauthorized, unknown-type and handler failures. Business failures a
  // handler returns count as executed.
  size_t failed = 0;
  // Mutable copy of the log's start state for the caller to restore.
  payload::Value start_state;
};

// =============================================================================
// CommandRecorder
// Snapshots every recorded command, so later writes to a caller's payload
// never reach the log.
// =============================================================================

class CommandRecorder {
 public:
  // Throws std::invalid_argument if start_state is cyclic.
  explicit CommandRecorder(const payload::Value& start_state = payload::Value(),
                           std::optional<uint64_t> seed = std::nullopt,
                           std::shared_ptr<telemetry::ITelemetrySink> telemetry = nullptr,
                           std::shared_ptr<time::ITimeSource> time_source = nullptr);

  CommandRecorder(const CommandRecorder&) = delete;
  CommandRecorder& operator=(const CommandRecorder&) = delete;

  void Record(const Command& command);
  void Record(const CommandSnapshot& command);

  CommandLog Export() const;

  // Drops every recorded command and starts over from next_state.
  void Clear(const payload::Value& next_state, std::optional<uint64_t> seed = std::nullopt);

  size_t Size() const { return commands_.size(); }
  int64_t LastStep() const { return last_step_; }

  // Re-dispatches every command of `log` with AuthorizationPhase::kReplay.
  //
  // With a target:
  //   - its queue must be empty ("ReplayQueueNotEmpty", std::logic_error);
  //   - steps follow each command while it runs;
  //   - commands a handler enqueues must appear later in the log
  //     ("ReplayMissingFollowupCommand", std::runtime_error), and are drained
  //     so they only run from the log;
  //   - afterwards both steps sit at last_step + 1, or are restored when the
  //     replay throws.
  // Execution failures record "ReplayExecutionFailed" or
  // "ReplayUnknownCommandType" and replay continues.
  ReplayResult Replay(const CommandLog& log, CommandDispatcher& dispatcher,
                      IReplayTarget* target = nullptr) const;

 private:
  void ClaimFollowups(const CommandLog& log, size_t index, CommandQueue& queue,
                      std::vector<bool>& claimed) const;

  const std::shared_ptr<telemetry::ITelemetrySink> telemetry_;
  const std::shared_ptr<time::ITimeSource> time_source_;

  snapshot::ImmutableValue start_state_;
  std::optional<uint64_t> seed_;
  std::vector<CommandSnapshot> commands_;
  int64_t last_step_ = -1;
};

// Same type, priority, step and timestamp, and structurally equal payloads.
bool CommandsMatch(const CommandSnapshot& left, const CommandSnapshot& right);

}  // namespace simcore::command

#endif  // SIMCORE_COMMAND_COMMAND_RECORDER_HPP_
