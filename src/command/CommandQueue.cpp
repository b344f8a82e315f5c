// Repository: simcore
// Component: Command Queue
// Purpose: Priority-bucketed, capacity-bounded holding area for commands.
// Copyright (c) 2025 simcore

#include "simcore/command/CommandQueue.hpp"

#include <stdexcept>

#include "simcore/util/Logger.hpp"

namespace simcore::command {

const char* EnqueueOutcomeToString(EnqueueOutcome outcome) {
  switch (outcome) {
    case EnqueueOutcome::kAccepted:             return "ACCEPTED";
    case EnqueueOutcome::kAcceptedWithEviction: return "ACCEPTED_WITH_EVICTION";
    case EnqueueOutcome::kUnauthorized:         return "UNAUTHORIZED";
    case EnqueueOutcome::kRejectedAtCapacity:   return "REJECTED_AT_CAPACITY";
  }
  return "UNKNOWN";
}

CommandQueue::CommandQueue(size_t max_size,
                           std::shared_ptr<telemetry::ITelemetrySink> telemetry,
                           std::shared_ptr<const CommandAuthorizationTable> authorization)
    : max_size_(max_size),
      telemetry_(telemetry::OrNullTelemetry(std::move(telemetry))),
      authorization_(CommandAuthorizationTable::OrDefault(std::move(authorization))) {
  if (max_size_ == 0) {
    throw std::invalid_argument("CommandQueue max size must be positive");
  }
}

size_t CommandQueue::SizeOf(CommandPriority priority) const {
  return buckets_[CommandPriorityIndex(priority)].size();
}

size_t CommandQueue::LowestNonEmptyBucket() const {
  for (size_t i = kCommandPriorityCount; i-- > 0;) {
    if (!buckets_[i].empty()) return i;
  }
  throw std::logic_error("CommandQueue::LowestNonEmptyBucket on empty queue");
}

// =============================================================================
// Admission
// =============================================================================

EnqueueOutcome CommandQueue::Enqueue(const Command& command) {
  const size_t lane = CommandPriorityIndex(command.priority);
  const char* priority_name = CommandPriorityToString(command.priority);

  AuthorizationContext context;
  context.phase = AuthorizationPhase::kLive;
  context.reason = "queue";
  if (!authorization_->Authorize(command.type, command.priority, *telemetry_, context)) {
    util::Logger::Debug("[CommandQueue] Unauthorized " + command.type + " at " +
                        priority_name);
    return EnqueueOutcome::kUnauthorized;
  }

  QueueEntry entry;
  entry.command = SnapshotCommand(command);

  EnqueueOutcome outcome = EnqueueOutcome::kAccepted;
  if (size_ >= max_size_) {
    telemetry_->RecordWarning("CommandQueueOverflow",
                              {{"size", static_cast<uint64_t>(size_)},
                               {"maxSize", static_cast<uint64_t>(max_size_)},
                               {"priority", priority_name}});

    const size_t lowest = LowestNonEmptyBucket();
    if (lane >= lowest) {
      // The incoming lane is already the lowest occupied priority; keep the
      // older entries and refuse the newcomer.
      telemetry_->RecordWarning("CommandRejected",
                                {{"type", command.type},
                                 {"priority", priority_name},
                                 {"timestamp", command.timestamp},
                                 {"size", static_cast<uint64_t>(size_)},
                                 {"maxSize", static_cast<uint64_t>(max_size_)}});
      return EnqueueOutcome::kRejectedAtCapacity;
    }

    QueueEntry evicted = std::move(buckets_[lowest].front());
    buckets_[lowest].pop_front();
    --size_;
    telemetry_->RecordWarning(
        "CommandDropped",
        {{"type", evicted.command.type},
         {"priority", CommandPriorityToString(evicted.command.priority)},
         {"timestamp", evicted.command.timestamp}});
    outcome = EnqueueOutcome::kAcceptedWithEviction;
  }

  entry.sequence = next_sequence_++;
  buckets_[lane].push_back(std::move(entry));
  ++size_;
  return outcome;
}

// =============================================================================
// Draining
// =============================================================================

std::vector<CommandSnapshot> CommandQueue::DequeueAll() {
  std::vector<CommandSnapshot> drained;
  drained.reserve(size_);
  for (auto& bucket : buckets_) {
    for (auto& entry : bucket) {
      drained.push_back(std::move(entry.command));
    }
    bucket.clear();
  }
  size_ = 0;
  return drained;
}

std::vector<CommandSnapshot> CommandQueue::DequeueUpToStep(int64_t step) {
  std::vector<CommandSnapshot> drained;
  for (auto& bucket : buckets_) {
    Bucket remaining;
    for (auto& entry : bucket) {
      if (entry.command.step <= step) {
        drained.push_back(std::move(entry.command));
      } else {
        remaining.push_back(std::move(entry));
      }
    }
    bucket.swap(remaining);
  }
  size_ -= drained.size();
  return drained;
}

void CommandQueue::Clear() {
  for (auto& bucket : buckets_) {
    bucket.clear();
  }
  size_ = 0;
}

}  // namespace simcore::command
