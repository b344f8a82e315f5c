// Repository: simcore
// Component: Command Transport Boundary
// Purpose: Types exchanged with the network transport collaborator.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_COMMAND_COMMAND_TRANSPORT_HPP_
#define SIMCORE_COMMAND_COMMAND_TRANSPORT_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "simcore/command/Command.hpp"
#include "simcore/command/CommandDispatcher.hpp"
#include "simcore/payload/Value.hpp"

namespace simcore::command {

// Wire-neutral form of a command as received from a client. Priority is
// carried as the raw lane number.
struct SerializedCommand {
  std::string type;
  int32_t priority = static_cast<int32_t>(CommandPriority::kPlayer);
  int64_t timestamp = 0;
  int64_t step = 0;
  payload::Value payload;
  std::optional<std::string> request_id;
};

// Throws std::invalid_argument for a priority outside the three lanes.
Command CommandFromSerialized(const SerializedCommand& serialized);
SerializedCommand SerializeCommand(const Command& command);

enum class CommandResponseStatus {
  kAccepted,
  kRejected,
  kDuplicate,
};

const char* CommandResponseStatusToString(CommandResponseStatus status);

struct CommandResponse {
  std::string request_id;
  CommandResponseStatus status = CommandResponseStatus::kAccepted;
  int64_t server_step = 0;
  std::optional<CommandError> error;

  static CommandResponse Accepted(std::string request_id, int64_t server_step);
  static CommandResponse Rejected(std::string request_id, int64_t server_step,
                                  CommandError error);
};

// The answer to a retried submission: the cached outcome marked duplicate.
CommandResponse MakeDuplicateResponse(const CommandResponse& cached);

}  // namespace simcore::command

#endif  // SIMCORE_COMMAND_COMMAND_TRANSPORT_HPP_
