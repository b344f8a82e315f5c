// Repository: simcore
// Component: Command Model
// Purpose: Command, priority lanes and the runtime command type catalog.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_COMMAND_COMMAND_HPP_
#define SIMCORE_COMMAND_COMMAND_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "simcore/payload/Value.hpp"
#include "simcore/snapshot/ImmutableValue.hpp"

namespace simcore::command {

// =============================================================================
// Priority lanes
// Drain order is SYSTEM < PLAYER < AUTOMATION.
// =============================================================================

enum class CommandPriority : int32_t {
  kSystem = 0,
  kPlayer = 1,
  kAutomation = 2,
};

inline constexpr size_t kCommandPriorityCount = 3;

inline constexpr std::array<CommandPriority, kCommandPriorityCount> kCommandPriorityOrder = {
    CommandPriority::kSystem,
    CommandPriority::kPlayer,
    CommandPriority::kAutomation,
};

const char* CommandPriorityToString(CommandPriority priority);

bool IsValidCommandPriority(CommandPriority priority);

// Throws std::invalid_argument for anything outside the three lanes.
CommandPriority CommandPriorityFromInt(int32_t value);

// Lane index for bucket storage. Throws std::invalid_argument when invalid.
size_t CommandPriorityIndex(CommandPriority priority);

// =============================================================================
// Command types
// =============================================================================

namespace command_types {
inline constexpr const char* kPurchaseGenerator = "PURCHASE_GENERATOR";
inline constexpr const char* kPurchaseUpgrade = "PURCHASE_UPGRADE";
inline constexpr const char* kToggleGenerator = "TOGGLE_GENERATOR";
inline constexpr const char* kToggleAutomation = "TOGGLE_AUTOMATION";
inline constexpr const char* kCollectResource = "COLLECT_RESOURCE";
inline constexpr const char* kPrestigeReset = "PRESTIGE_RESET";
inline constexpr const char* kOfflineCatchup = "OFFLINE_CATCHUP";
inline constexpr const char* kApplyMigration = "APPLY_MIGRATION";
inline constexpr const char* kRunTransform = "RUN_TRANSFORM";
inline constexpr const char* kMakeMissionDecision = "MAKE_MISSION_DECISION";
inline constexpr const char* kAddEntityExperience = "ADD_ENTITY_EXPERIENCE";
inline constexpr const char* kAssignEntityToMission = "ASSIGN_ENTITY_TO_MISSION";
inline constexpr const char* kCreateEntityInstance = "CREATE_ENTITY_INSTANCE";
inline constexpr const char* kDestroyEntityInstance = "DESTROY_ENTITY_INSTANCE";
inline constexpr const char* kInputEvent = "INPUT_EVENT";
inline constexpr const char* kReturnEntityFromMission = "RETURN_ENTITY_FROM_MISSION";
inline constexpr const char* kAddEntity = "ADD_ENTITY";
inline constexpr const char* kRemoveEntity = "REMOVE_ENTITY";
}  // namespace command_types

// =============================================================================
// Command
// Producer-side form. The payload is mutable and owned by the caller; the
// queue snapshots it on admission.
// =============================================================================

struct Command {
  std::string type;
  CommandPriority priority = CommandPriority::kPlayer;
  payload::Value payload;
  int64_t timestamp = 0;  // ms
  int64_t step = 0;
  std::optional<std::string> request_id;
};

// Admitted form. Consumed exactly once when drained and executed.
struct CommandSnapshot {
  std::string type;
  CommandPriority priority = CommandPriority::kPlayer;
  snapshot::ImmutableValue payload;
  int64_t timestamp = 0;
  int64_t step = 0;
  std::optional<std::string> request_id;
};

// Throws std::invalid_argument on an invalid priority.
CommandSnapshot SnapshotCommand(const Command& command);

}  // namespace simcore::command

#endif  // SIMCORE_COMMAND_COMMAND_HPP_
