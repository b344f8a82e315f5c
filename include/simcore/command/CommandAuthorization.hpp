// Repository: simcore
// Component: Command Authorization
// Purpose: Static command type to allowed priority lane policy table.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_COMMAND_COMMAND_AUTHORIZATION_HPP_
#define SIMCORE_COMMAND_COMMAND_AUTHORIZATION_HPP_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "simcore/command/Command.hpp"
#include "simcore/telemetry/TelemetrySink.hpp"

namespace simcore::command {

inline constexpr const char* kDefaultUnauthorizedEvent = "CommandPriorityViolation";

struct AuthorizationPolicy {
  std::string type;
  std::vector<CommandPriority> allowed_priorities;
  std::string rationale;
  // Telemetry event recorded on violation; kDefaultUnauthorizedEvent if unset.
  std::optional<std::string> unauthorized_event;

  bool Allows(CommandPriority priority) const;
  const std::string& UnauthorizedEvent() const;
};

enum class AuthorizationPhase {
  kLive,
  kReplay,
};

const char* AuthorizationPhaseToString(AuthorizationPhase phase);

// Which check is asking. Carried into the violation telemetry.
struct AuthorizationContext {
  AuthorizationPhase phase = AuthorizationPhase::kLive;
  std::optional<std::string> reason;
};

// =============================================================================
// CommandAuthorizationTable
// Read-only after construction. The queue (admission) and the dispatcher
// (execution) both consult the same table.
// =============================================================================

class CommandAuthorizationTable {
 public:
  using Policies = std::map<std::string, AuthorizationPolicy>;

  // Throws std::invalid_argument for an empty type, an empty allowed set, an
  // invalid priority or a duplicate type.
  explicit CommandAuthorizationTable(std::vector<AuthorizationPolicy> policies);

  // Built-in policies for the runtime command types. Shared, never null.
  static std::shared_ptr<const CommandAuthorizationTable> Default();

  // `table` when set, otherwise Default().
  static std::shared_ptr<const CommandAuthorizationTable> OrDefault(
      std::shared_ptr<const CommandAuthorizationTable> table);

  // nullptr for types without a policy.
  const AuthorizationPolicy* Find(const std::string& type) const;
  size_t Size() const { return policies_.size(); }
  Policies::const_iterator begin() const { return policies_.begin(); }
  Policies::const_iterator end() const { return policies_.end(); }

  // Types without a policy are authorized. A violation records a telemetry
  // warning with type, attemptedPriority, allowedPriorities, phase and
  // (when set) reason, and returns false.
  bool Authorize(const std::string& type, CommandPriority priority,
                 telemetry::ITelemetrySink& sink,
                 const AuthorizationContext& context = {}) const;

 private:
  Policies policies_;
};

}  // namespace simcore::command

#endif  // SIMCORE_COMMAND_COMMAND_AUTHORIZATION_HPP_
