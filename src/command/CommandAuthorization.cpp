// Repository: simcore
// Component: Command Authorization
// Purpose: Static command type to allowed priority lane policy table.
// Copyright (c) 2025 simcore

#include "simcore/command/CommandAuthorization.hpp"

#include <algorithm>
#include <stdexcept>

namespace simcore::command {

namespace {

constexpr CommandPriority kSystem = CommandPriority::kSystem;
constexpr CommandPriority kPlayer = CommandPriority::kPlayer;
constexpr CommandPriority kAutomation = CommandPriority::kAutomation;

std::vector<AuthorizationPolicy> BuildDefaultPolicies() {
  namespace t = command_types;
  return {
      {t::kPurchaseGenerator, {kSystem, kPlayer, kAutomation},
       "Players and automation purchase generators; system replays migrations.", {}},
      {t::kPurchaseUpgrade, {kSystem, kPlayer, kAutomation},
       "Upgrades follow the same lanes as generator purchases.", {}},
      {t::kToggleGenerator, {kSystem, kPlayer, kAutomation},
       "Generators may be toggled by players, automation or system restores.", {}},
      {t::kToggleAutomation, {kPlayer, kAutomation},
       "Automation toggles originate from the player or automation rules.", {}},
      {t::kCollectResource, {kSystem, kPlayer, kAutomation},
       "Resource collection is open to every lane.", {}},
      {t::kPrestigeReset, {kSystem, kPlayer},
       "Prestige resets are irreversible and require player intent.",
       std::string("AutomationPrestigeBlocked")},
      {t::kOfflineCatchup, {kSystem},
       "Offline catch-up is applied by the runtime on resume.", {}},
      {t::kApplyMigration, {kSystem},
       "Save migrations run only as system lifecycle work.",
       std::string("UnauthorizedSystemCommand")},
      {t::kRunTransform, {kSystem, kPlayer},
       "Transforms consume resources and require explicit intent.",
       std::string("UnauthorizedTransformCommand")},
      {t::kMakeMissionDecision, {kSystem, kPlayer},
       "Mission decisions are player choices.", {}},
      {t::kAddEntityExperience, {kSystem, kAutomation},
       "Experience is granted by system progression or automation.", {}},
      {t::kAssignEntityToMission, {kSystem, kPlayer, kAutomation},
       "Mission assignment is open to every lane.", {}},
      {t::kCreateEntityInstance, {kSystem, kPlayer, kAutomation},
       "Entity instances may be created by any lane.", {}},
      {t::kDestroyEntityInstance, {kSystem, kPlayer, kAutomation},
       "Entity instances may be destroyed by any lane.", {}},
      {t::kInputEvent, {kSystem, kPlayer},
       "Input events come from the player or the host.", {}},
      {t::kReturnEntityFromMission, {kSystem, kPlayer, kAutomation},
       "Mission returns are open to every lane.", {}},
      {t::kAddEntity, {kSystem},
       "Entity roster changes are system lifecycle work.", {}},
      {t::kRemoveEntity, {kSystem},
       "Entity roster changes are system lifecycle work.", {}},
  };
}

}  // namespace

bool AuthorizationPolicy::Allows(CommandPriority priority) const {
  return std::find(allowed_priorities.begin(), allowed_priorities.end(), priority) !=
         allowed_priorities.end();
}

const std::string& AuthorizationPolicy::UnauthorizedEvent() const {
  static const std::string kDefault = kDefaultUnauthorizedEvent;
  return unauthorized_event ? *unauthorized_event : kDefault;
}

const char* AuthorizationPhaseToString(AuthorizationPhase phase) {
  switch (phase) {
    case AuthorizationPhase::kLive:   return "live";
    case AuthorizationPhase::kReplay: return "replay";
  }
  return "unknown";
}

CommandAuthorizationTable::CommandAuthorizationTable(
    std::vector<AuthorizationPolicy> policies) {
  for (auto& policy : policies) {
    if (policy.type.empty()) {
      throw std::invalid_argument("Authorization policy requires a command type");
    }
    if (policy.allowed_priorities.empty()) {
      throw std::invalid_argument("Authorization policy for " + policy.type +
                                  " must allow at least one priority");
    }
    for (CommandPriority priority : policy.allowed_priorities) {
      if (!IsValidCommandPriority(priority)) {
        throw std::invalid_argument("Authorization policy for " + policy.type +
                                    " names an invalid priority");
      }
    }
    std::string type = policy.type;
    if (!policies_.emplace(type, std::move(policy)).second) {
      throw std::invalid_argument("Duplicate authorization policy for " + type);
    }
  }
}

std::shared_ptr<const CommandAuthorizationTable> CommandAuthorizationTable::Default() {
  static const auto kTable =
      std::make_shared<const CommandAuthorizationTable>(BuildDefaultPolicies());
  return kTable;
}

std::shared_ptr<const CommandAuthorizationTable> CommandAuthorizationTable::OrDefault(
    std::shared_ptr<const CommandAuthorizationTable> table) {
  return table ? std::move(table) : Default();
}

const AuthorizationPolicy* CommandAuthorizationTable::Find(const std::string& type) const {
  auto it = policies_.find(type);
  return it == policies_.end() ? nullptr : &it->second;
}

bool CommandAuthorizationTable::Authorize(const std::string& type,
                                          CommandPriority priority,
                                          telemetry::ITelemetrySink& sink,
                                          const AuthorizationContext& context) const {
  const AuthorizationPolicy* policy = Find(type);
  if (policy == nullptr || policy->Allows(priority)) {
    return true;
  }

  std::vector<std::string> allowed;
  allowed.reserve(policy->allowed_priorities.size());
  for (CommandPriority lane : policy->allowed_priorities) {
    allowed.emplace_back(CommandPriorityToString(lane));
  }

  telemetry::TelemetryData data{
      {"type", type},
      {"attemptedPriority", CommandPriorityToString(priority)},
      {"allowedPriorities", std::move(allowed)},
      {"phase", AuthorizationPhaseToString(context.phase)},
  };
  if (context.reason) {
    data.emplace("reason", *context.reason);
  }
  sink.RecordWarning(policy->UnauthorizedEvent(), data);
  return false;
}

}  // namespace simcore::command
