// Repository: simcore
// Component: Command Recorder
// Purpose: Records admitted commands and replays them through a dispatcher.
// Copyright (c) 2025 simcore

#include "simcore/command/CommandRecorder.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>

#include "simcore/snapshot/Snapshot.hpp"
#include "simcore/time/SystemTimeSource.hpp"
#include "simcore/util/Logger.hpp"

namespace simcore::command {

namespace {

// Dispatcher-level failures; any other code is a handler's business outcome.
bool IsReplayFailure(const CommandResult& result) {
  if (result.success) return false;
  const std::string& code = result.ErrorCode();
  return code == CommandErrorCodeToString(CommandErrorCode::kUnknownCommandType) ||
         code == CommandErrorCodeToString(CommandErrorCode::kCommandUnauthorized) ||
         code == CommandErrorCodeToString(CommandErrorCode::kCommandExecutionFailed) ||
         code == CommandErrorCodeToString(CommandErrorCode::kCommandResultInvalid);
}

int64_t FinalStep(const CommandLog& log) {
  if (log.last_step >= 0) return log.last_step;
  int64_t final_step = -1;
  for (const auto& command : log.commands) {
    final_step = std::max(final_step, command.step);
  }
  return final_step;
}

}  // namespace

bool CommandsMatch(const CommandSnapshot& left, const CommandSnapshot& right) {
  return left.type == right.type && left.priority == right.priority &&
         left.step == right.step && left.timestamp == right.timestamp &&
         snapshot::StructurallyEqual(left.payload, right.payload);
}

CommandRecorder::CommandRecorder(const payload::Value& start_state,
                                 std::optional<uint64_t> seed,
                                 std::shared_ptr<telemetry::ITelemetrySink> telemetry,
                                 std::shared_ptr<time::ITimeSource> time_source)
    : telemetry_(telemetry::OrNullTelemetry(std::move(telemetry))),
      time_source_(time_source ? std::move(time_source)
                               : std::make_shared<time::SystemTimeSource>()),
      start_state_(snapshot::Snapshot(start_state)),
      seed_(seed) {}

void CommandRecorder::Record(const Command& command) {
  Record(SnapshotCommand(command));
}

void CommandRecorder::Record(const CommandSnapshot& command) {
  commands_.push_back(command);
  last_step_ = std::max(last_step_, command.step);
}

CommandLog CommandRecorder::Export() const {
  CommandLog log;
  log.start_state = start_state_;
  log.commands = commands_;
  log.recorded_at_ms = time_source_->NowUtcMs();
  log.seed = seed_;
  log.last_step = last_step_;
  return log;
}

void CommandRecorder::Clear(const payload::Value& next_state, std::optional<uint64_t> seed) {
  start_state_ = snapshot::Snapshot(next_state);
  seed_ = seed;
  commands_.clear();
  last_step_ = -1;
}

// =============================================================================
// Replay
// =============================================================================

void CommandRecorder::ClaimFollowups(const CommandLog& log, size_t index,
                                     CommandQueue& queue,
                                     std::vector<bool>& claimed) const {
  for (const CommandSnapshot& queued : queue.DequeueAll()) {
    size_t match = log.commands.size();
    for (size_t j = index + 1; j < log.commands.size(); ++j) {
      if (!claimed[j] && CommandsMatch(log.commands[j], queued)) {
        match = j;
        break;
      }
    }
    if (match == log.commands.size()) {
      telemetry_->RecordError("ReplayMissingFollowupCommand",
                              {{"type", queued.type}, {"step", queued.step}});
      throw std::runtime_error(
          "Replay log is missing a command that was enqueued during handler execution.");
    }
    claimed[match] = true;
  }
}

ReplayResult CommandRecorder::Replay(const CommandLog& log, CommandDispatcher& dispatcher,
                                     IReplayTarget* target) const {
  if (target != nullptr && target->GetCommandQueue().Size() > 0) {
    telemetry_->RecordError("ReplayQueueNotEmpty",
                            {{"pending", static_cast<int64_t>(target->GetCommandQueue().Size())}});
    throw std::logic_error("Command queue must be empty before replay begins.");
  }

  ReplayResult result;
  result.start_state = log.start_state.ToMutable();

  const int64_t previous_step = target != nullptr ? target->CurrentStep() : 0;
  const int64_t previous_next_step = target != nullptr ? target->NextExecutableStep() : 0;
  std::vector<bool> claimed(log.commands.size(), false);

  try {
    for (size_t i = 0; i < log.commands.size(); ++i) {
      const CommandSnapshot& command = log.commands[i];
      if (target != nullptr) {
        target->RestoreSteps(command.step, command.step + 1);
      }

      CommandResult outcome = dispatcher.ExecuteWithResult(command, AuthorizationPhase::kReplay);
      if (IsReplayFailure(outcome)) {
        ++result.failed;
        const bool unknown =
            outcome.ErrorCode() ==
            CommandErrorCodeToString(CommandErrorCode::kUnknownCommandType);
        telemetry_->RecordError(unknown ? "ReplayUnknownCommandType" : "ReplayExecutionFailed",
                                {{"type", command.type},
                                 {"step", command.step},
                                 {"code", outcome.ErrorCode()},
                                 {"error", outcome.error->message}});
      } else {
        ++result.executed;
      }

      if (target != nullptr) {
        ClaimFollowups(log, i, target->GetCommandQueue(), claimed);
      }
    }
  } catch (const std::exception&) {
    if (target != nullptr) {
      target->RestoreSteps(previous_step, previous_next_step);
    }
    throw;
  }

  if (target != nullptr) {
    const int64_t final_step = FinalStep(log);
    if (final_step >= 0) {
      target->RestoreSteps(final_step + 1, final_step + 1);
    } else {
      target->RestoreSteps(previous_step, previous_next_step);
    }
  }

  util::Logger::Debug("[CommandRecorder] Replayed " + std::to_string(result.executed) +
                      " commands, " + std::to_string(result.failed) + " failed");
  return result;
}

}  // namespace simcore::command
