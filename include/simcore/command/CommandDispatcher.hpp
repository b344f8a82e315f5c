// Repository: simcore
// Component: Command Dispatcher
// Purpose: Per-type handler registry; re-authorizes, executes, normalizes.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_COMMAND_COMMAND_DISPATCHER_HPP_
#define SIMCORE_COMMAND_COMMAND_DISPATCHER_HPP_

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "simcore/command/Command.hpp"
#include "simcore/command/CommandAuthorization.hpp"
#include "simcore/payload/Value.hpp"
#include "simcore/snapshot/ImmutableValue.hpp"
#include "simcore/telemetry/TelemetrySink.hpp"

namespace simcore::command {

// =============================================================================
// Results
// =============================================================================

enum class CommandErrorCode {
  kUnknownCommandType,
  kCommandUnauthorized,
  kCommandExecutionFailed,
  kCommandResultInvalid,
};

const char* CommandErrorCodeToString(CommandErrorCode code);

using CommandErrorDetails = std::map<std::string, std::string>;

struct CommandError {
  // Stable machine-readable code: one of CommandErrorCode or a
  // handler-defined business code.
  std::string code;
  std::string message;
  CommandErrorDetails details;
};

struct CommandResult {
  bool success = true;
  std::optional<CommandError> error;

  static CommandResult Success() { return CommandResult{}; }
  static CommandResult Failure(std::string code, std::string message,
                               CommandErrorDetails details = {}) {
    CommandResult result;
    result.success = false;
    result.error = CommandError{std::move(code), std::move(message), std::move(details)};
    return result;
  }
  static CommandResult Failure(CommandErrorCode code, std::string message,
                               CommandErrorDetails details = {}) {
    return Failure(CommandErrorCodeToString(code), std::move(message), std::move(details));
  }

  // Empty string on success.
  const std::string& ErrorCode() const;
};

// =============================================================================
// Handler contract
// =============================================================================

class IEventPublisher {
 public:
  virtual ~IEventPublisher() = default;
  virtual void Publish(const std::string& event_type, const payload::Value& payload) = 0;
};

struct ExecutionContext {
  int64_t step;
  int64_t timestamp;
  CommandPriority priority;
  IEventPublisher& events;
  std::optional<std::string> request_id;
};

// What a handler hands back: nothing (success), an immediate result, or a
// future that settles later. A future that throws, or one with no shared
// state, counts as a handler failure.
class CommandHandlerResult {
 public:
  CommandHandlerResult() = default;
  CommandHandlerResult(CommandResult result) : value_(std::move(result)) {}
  CommandHandlerResult(std::future<void> pending) : value_(std::move(pending)) {}
  CommandHandlerResult(std::future<CommandResult> pending) : value_(std::move(pending)) {}

  bool IsPending() const { return value_.index() >= 2; }
  // True when not pending or when the future has settled.
  bool IsReady() const;
  // Blocks on a pending future; rethrows what the handler's work threw.
  std::optional<CommandResult> Get();

 private:
  std::variant<std::monostate, CommandResult, std::future<void>, std::future<CommandResult>>
      value_;
};

// =============================================================================
// CommandDispatcher
// =============================================================================

class CommandDispatcher {
 public:
  using CommandHandler = std::function<CommandHandlerResult(
      const snapshot::ImmutableValue& payload, const ExecutionContext& context)>;
  using HandlerVisitor = std::function<void(const std::string&, const CommandHandler&)>;

  // A null table means CommandAuthorizationTable::Default().
  explicit CommandDispatcher(
      std::shared_ptr<telemetry::ITelemetrySink> telemetry = nullptr,
      std::shared_ptr<const CommandAuthorizationTable> authorization = nullptr);

  CommandDispatcher(const CommandDispatcher&) = delete;
  CommandDispatcher& operator=(const CommandDispatcher&) = delete;

  // Accepts handlers returning void, CommandResult, std::future<void>,
  // std::future<CommandResult> or CommandHandlerResult. Replaces any handler
  // already registered for `type`.
  template <typename Fn>
  void Register(const std::string& type, Fn&& handler) {
    using Result = std::invoke_result_t<Fn&, const snapshot::ImmutableValue&,
                                        const ExecutionContext&>;
    if constexpr (std::is_void_v<Result>) {
      RegisterHandler(type, [fn = std::forward<Fn>(handler)](
                                const snapshot::ImmutableValue& payload,
                                const ExecutionContext& context) mutable
                                -> CommandHandlerResult {
        fn(payload, context);
        return CommandHandlerResult();
      });
    } else {
      RegisterHandler(type, CommandHandler(std::forward<Fn>(handler)));
    }
  }

  void RegisterHandler(const std::string& type, CommandHandler handler);
  bool Unregister(const std::string& type);
  bool HasHandler(const std::string& type) const;
  size_t HandlerCount() const { return handlers_.size(); }

  // Introspection only.
  void ForEachHandler(const HandlerVisitor& visitor) const;

  // Without a publisher, a handler's Publish() throws and the command fails
  // with COMMAND_EXECUTION_FAILED.
  void SetEventPublisher(std::shared_ptr<IEventPublisher> publisher);

  // ==========================================================================
  // Execution
  // 1. Re-authorize (reason "dispatcher", phase "live" or "replay") → COMMAND_UNAUTHORIZED
  // 2. Unregistered type → "UnknownCommandType" error + UNKNOWN_COMMAND_TYPE
  // 3. Invoke handler(payload, context)
  // 4. Normalize: nothing → success; failure passes through (empty code →
  //    COMMAND_RESULT_INVALID); thrown → COMMAND_EXECUTION_FAILED with one
  //    "CommandExecutionFailed" telemetry error.
  // Nothing is thrown out of Execute / ExecuteWithResult.
  // ==========================================================================

  // Fire-and-forget. Pending work settles through PollPending/DrainPending.
  void Execute(const CommandSnapshot& command);

  // Waits for pending work and returns the settled result. Replay passes
  // AuthorizationPhase::kReplay so violations are tagged accordingly.
  CommandResult ExecuteWithResult(const CommandSnapshot& command,
                                  AuthorizationPhase phase = AuthorizationPhase::kLive);

  // Settles pending executions whose futures are ready, including futures
  // with no shared state (COMMAND_EXECUTION_FAILED). Returns the count.
  size_t PollPending();
  // Blocks until every pending execution settles.
  void DrainPending();
  size_t PendingCount() const { return pending_.size(); }

 private:
  struct PendingExecution {
    std::string type;
    CommandHandlerResult handle;
  };

  // Runs steps 1-3. Either a settled result or a pending execution.
  std::variant<CommandResult, PendingExecution> Begin(const CommandSnapshot& command,
                                                      AuthorizationPhase phase);
  CommandResult Settle(PendingExecution& execution);
  CommandResult HandlerFailure(const std::string& type, const std::string& what);
  static CommandResult Normalize(CommandResult result);

  const std::shared_ptr<telemetry::ITelemetrySink> telemetry_;
  const std::shared_ptr<const CommandAuthorizationTable> authorization_;
  std::shared_ptr<IEventPublisher> event_publisher_;
  std::map<std::string, CommandHandler> handlers_;
  std::vector<PendingExecution> pending_;
};

}  // namespace simcore::command

#endif  // SIMCORE_COMMAND_COMMAND_DISPATCHER_HPP_
