// Repository: simcore
// Component: Command Transport Boundary
// Purpose: Types exchanged with the network transport collaborator.
// Copyright (c) 2025 simcore

#include "simcore/command/CommandTransport.hpp"

namespace simcore::command {

Command CommandFromSerialized(const SerializedCommand& serialized) {
  Command command;
  command.type = serialized.type;
  command.priority = CommandPriorityFromInt(serialized.priority);
  command.timestamp = serialized.timestamp;
  command.step = serialized.step;
  command.payload = serialized.payload;
  command.request_id = serialized.request_id;
  return command;
}

SerializedCommand SerializeCommand(const Command& command) {
  SerializedCommand serialized;
  serialized.type = command.type;
  serialized.priority = static_cast<int32_t>(CommandPriorityIndex(command.priority));
  serialized.timestamp = command.timestamp;
  serialized.step = command.step;
  serialized.payload = command.payload;
  serialized.request_id = command.request_id;
  return serialized;
}

const char* CommandResponseStatusToString(CommandResponseStatus status) {
  switch (status) {
    case CommandResponseStatus::kAccepted:  return "accepted";
    case CommandResponseStatus::kRejected:  return "rejected";
    case CommandResponseStatus::kDuplicate: return "duplicate";
  }
  return "unknown";
}

CommandResponse CommandResponse::Accepted(std::string request_id, int64_t server_step) {
  CommandResponse response;
  response.request_id = std::move(request_id);
  response.status = CommandResponseStatus::kAccepted;
  response.server_step = server_step;
  return response;
}

CommandResponse CommandResponse::Rejected(std::string request_id, int64_t server_step,
                                          CommandError error) {
  CommandResponse response;
  response.request_id = std::move(request_id);
  response.status = CommandResponseStatus::kRejected;
  response.server_step = server_step;
  response.error = std::move(error);
  return response;
}

CommandResponse MakeDuplicateResponse(const CommandResponse& cached) {
  CommandResponse duplicate = cached;
  duplicate.status = CommandResponseStatus::kDuplicate;
  return duplicate;
}

}  // namespace simcore::command
