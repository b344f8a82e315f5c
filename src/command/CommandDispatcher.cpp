// Repository: simcore
// Component: Command Dispatcher
// Purpose: Per-type handler registry; re-authorizes, executes, normalizes.
// Copyright (c) 2025 simcore

#include "simcore/command/CommandDispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <stdexcept>

#include "simcore/util/Logger.hpp"

namespace simcore::command {

namespace {

// Stands in until SetEventPublisher() is called.
class UnconfiguredEventPublisher final : public IEventPublisher {
 public:
  void Publish(const std::string&, const payload::Value&) override {
    throw std::logic_error(
        "Event publisher has not been configured on this CommandDispatcher instance.");
  }
};

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

const char* CommandErrorCodeToString(CommandErrorCode code) {
  switch (code) {
    case CommandErrorCode::kUnknownCommandType:     return "UNKNOWN_COMMAND_TYPE";
    case CommandErrorCode::kCommandUnauthorized:    return "COMMAND_UNAUTHORIZED";
    case CommandErrorCode::kCommandExecutionFailed: return "COMMAND_EXECUTION_FAILED";
    case CommandErrorCode::kCommandResultInvalid:   return "COMMAND_RESULT_INVALID";
  }
  return "UNKNOWN";
}

const std::string& CommandResult::ErrorCode() const {
  static const std::string kEmpty;
  return error ? error->code : kEmpty;
}

// =============================================================================
// CommandHandlerResult
// =============================================================================

namespace {

// A future without shared state never settles; it counts as ready so Get()
// can report it as a handler failure.
template <typename T>
bool FutureReady(const std::future<T>& pending) {
  using namespace std::chrono_literals;
  return !pending.valid() || pending.wait_for(0ms) == std::future_status::ready;
}

template <typename T>
void RequireSharedState(const std::future<T>& pending) {
  if (!pending.valid()) {
    throw std::logic_error("Command handler returned a future with no shared state");
  }
}

}  // namespace

bool CommandHandlerResult::IsReady() const {
  if (auto* pending = std::get_if<std::future<void>>(&value_)) {
    return FutureReady(*pending);
  }
  if (auto* pending = std::get_if<std::future<CommandResult>>(&value_)) {
    return FutureReady(*pending);
  }
  return true;
}

std::optional<CommandResult> CommandHandlerResult::Get() {
  if (auto* immediate = std::get_if<CommandResult>(&value_)) {
    return *immediate;
  }
  if (auto* pending = std::get_if<std::future<void>>(&value_)) {
    RequireSharedState(*pending);
    pending->get();
    return std::nullopt;
  }
  if (auto* pending = std::get_if<std::future<CommandResult>>(&value_)) {
    RequireSharedState(*pending);
    return pending->get();
  }
  return std::nullopt;
}

// =============================================================================
// CommandDispatcher
// =============================================================================

CommandDispatcher::CommandDispatcher(
    std::shared_ptr<telemetry::ITelemetrySink> telemetry,
    std::shared_ptr<const CommandAuthorizationTable> authorization)
    : telemetry_(telemetry::OrNullTelemetry(std::move(telemetry))),
      authorization_(CommandAuthorizationTable::OrDefault(std::move(authorization))),
      event_publisher_(std::make_shared<UnconfiguredEventPublisher>()) {}

void CommandDispatcher::RegisterHandler(const std::string& type, CommandHandler handler) {
  if (!handler) {
    throw std::invalid_argument("CommandDispatcher handler for " + type + " is empty");
  }
  handlers_[type] = std::move(handler);
}

bool CommandDispatcher::Unregister(const std::string& type) {
  return handlers_.erase(type) > 0;
}

bool CommandDispatcher::HasHandler(const std::string& type) const {
  return handlers_.count(type) > 0;
}

void CommandDispatcher::ForEachHandler(const HandlerVisitor& visitor) const {
  for (const auto& [type, handler] : handlers_) {
    visitor(type, handler);
  }
}

void CommandDispatcher::SetEventPublisher(std::shared_ptr<IEventPublisher> publisher) {
  if (publisher) {
    event_publisher_ = std::move(publisher);
  } else {
    event_publisher_ = std::make_shared<UnconfiguredEventPublisher>();
  }
}

CommandResult CommandDispatcher::HandlerFailure(const std::string& type,
                                                const std::string& what) {
  telemetry_->RecordError("CommandExecutionFailed", {{"type", type}, {"error", what}});
  util::Logger::Debug("[CommandDispatcher] " + type + " failed: " + what);
  return CommandResult::Failure(CommandErrorCode::kCommandExecutionFailed, what,
                                {{"type", type}, {"error", what}});
}

CommandResult CommandDispatcher::Normalize(CommandResult result) {
  if (result.success) {
    return CommandResult::Success();
  }
  if (!result.error || IsBlank(result.error->code)) {
    return CommandResult::Failure(CommandErrorCode::kCommandResultInvalid,
                                  "Command handler returned an invalid failure result.");
  }
  return result;
}

std::variant<CommandResult, CommandDispatcher::PendingExecution> CommandDispatcher::Begin(
    const CommandSnapshot& command, AuthorizationPhase phase) {
  AuthorizationContext context;
  context.phase = phase;
  context.reason = "dispatcher";
  if (!authorization_->Authorize(command.type, command.priority, *telemetry_, context)) {
    return CommandResult::Failure(
        CommandErrorCode::kCommandUnauthorized,
        "Command priority is not authorized for this command.",
        {{"type", command.type}, {"priority", CommandPriorityToString(command.priority)}});
  }

  auto it = handlers_.find(command.type);
  if (it == handlers_.end()) {
    telemetry_->RecordError("UnknownCommandType", {{"type", command.type}});
    return CommandResult::Failure(CommandErrorCode::kUnknownCommandType,
                                  "Unknown command type.", {{"type", command.type}});
  }

  ExecutionContext execution_context{command.step, command.timestamp, command.priority,
                                     *event_publisher_, command.request_id};
  CommandHandlerResult handled;
  try {
    handled = it->second(command.payload, execution_context);
  } catch (const std::exception& e) {
    return HandlerFailure(command.type, e.what());
  } catch (...) {
    return HandlerFailure(command.type, "Unknown error");
  }

  if (handled.IsPending()) {
    return PendingExecution{command.type, std::move(handled)};
  }
  std::optional<CommandResult> immediate = handled.Get();
  return immediate ? Normalize(std::move(*immediate)) : CommandResult::Success();
}

CommandResult CommandDispatcher::Settle(PendingExecution& execution) {
  std::optional<CommandResult> settled;
  try {
    settled = execution.handle.Get();
  } catch (const std::exception& e) {
    return HandlerFailure(execution.type, e.what());
  } catch (...) {
    return HandlerFailure(execution.type, "Unknown error");
  }
  return settled ? Normalize(std::move(*settled)) : CommandResult::Success();
}

void CommandDispatcher::Execute(const CommandSnapshot& command) {
  auto begun = Begin(command, AuthorizationPhase::kLive);
  if (auto* pending = std::get_if<PendingExecution>(&begun)) {
    pending_.push_back(std::move(*pending));
  }
}

CommandResult CommandDispatcher::ExecuteWithResult(const CommandSnapshot& command,
                                                   AuthorizationPhase phase) {
  auto begun = Begin(command, phase);
  if (auto* pending = std::get_if<PendingExecution>(&begun)) {
    return Settle(*pending);
  }
  return std::get<CommandResult>(std::move(begun));
}

size_t CommandDispatcher::PollPending() {
  size_t settled = 0;
  auto it = pending_.begin();
  while (it != pending_.end()) {
    bool ready = true;
    try {
      ready = it->handle.IsReady();
    } catch (const std::exception& e) {
      // Settled here; the entry is dropped below.
      HandlerFailure(it->type, e.what());
      it = pending_.erase(it);
      ++settled;
      continue;
    }
    if (!ready) {
      ++it;
      continue;
    }
    // Failures are telemetered inside Settle.
    Settle(*it);
    it = pending_.erase(it);
    ++settled;
  }
  return settled;
}

void CommandDispatcher::DrainPending() {
  for (auto& execution : pending_) {
    Settle(execution);
  }
  pending_.clear();
}

}  // namespace simcore::command
