// Repository: simcore
// Component: Command Model
// Purpose: Command, priority lanes and the runtime command type catalog.
// Copyright (c) 2025 simcore

#include "simcore/command/Command.hpp"

#include <stdexcept>
#include <string>

#include "simcore/snapshot/Snapshot.hpp"

namespace simcore::command {

const char* CommandPriorityToString(CommandPriority priority) {
  switch (priority) {
    case CommandPriority::kSystem:     return "SYSTEM";
    case CommandPriority::kPlayer:     return "PLAYER";
    case CommandPriority::kAutomation: return "AUTOMATION";
  }
  return "INVALID";
}

bool IsValidCommandPriority(CommandPriority priority) {
  switch (priority) {
    case CommandPriority::kSystem:
    case CommandPriority::kPlayer:
    case CommandPriority::kAutomation:
      return true;
  }
  return false;
}

CommandPriority CommandPriorityFromInt(int32_t value) {
  const auto priority = static_cast<CommandPriority>(value);
  if (!IsValidCommandPriority(priority)) {
    throw std::invalid_argument("Invalid command priority: " + std::to_string(value));
  }
  return priority;
}

size_t CommandPriorityIndex(CommandPriority priority) {
  if (!IsValidCommandPriority(priority)) {
    throw std::invalid_argument("Invalid command priority: " +
                                std::to_string(static_cast<int32_t>(priority)));
  }
  return static_cast<size_t>(priority);
}

CommandSnapshot SnapshotCommand(const Command& command) {
  CommandSnapshot admitted;
  admitted.type = command.type;
  admitted.priority = CommandPriorityFromInt(static_cast<int32_t>(command.priority));
  admitted.payload = snapshot::Snapshot(command.payload);
  admitted.timestamp = command.timestamp;
  admitted.step = command.step;
  admitted.request_id = command.request_id;
  return admitted;
}

}  // namespace simcore::command
