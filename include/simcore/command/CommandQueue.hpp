// Repository: simcore
// Component: Command Queue
// Purpose: Priority-bucketed, capacity-bounded holding area for commands.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_COMMAND_COMMAND_QUEUE_HPP_
#define SIMCORE_COMMAND_COMMAND_QUEUE_HPP_

#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

#include "simcore/command/Command.hpp"
#include "simcore/command/CommandAuthorization.hpp"
#include "simcore/telemetry/TelemetrySink.hpp"

namespace simcore::command {

inline constexpr size_t kDefaultMaxQueueSize = 10000;

// Outcome of an Enqueue call. Rejections are also recorded as telemetry
// warnings; callers are free to ignore the value.
enum class EnqueueOutcome {
  kAccepted,
  kAcceptedWithEviction,  // admitted after dropping the oldest lower-priority entry
  kUnauthorized,
  kRejectedAtCapacity,
};

const char* EnqueueOutcomeToString(EnqueueOutcome outcome);

// =============================================================================
// CommandQueue
// One FIFO bucket per priority lane. Drain order is always (priority
// ascending, insertion sequence ascending), whatever the arrival interleaving.
// Single consumer; not thread-safe.
// =============================================================================

class CommandQueue {
 public:
  struct QueueEntry {
    CommandSnapshot command;
    uint64_t sequence = 0;
  };

  // Throws std::invalid_argument if max_size is 0. A null table means
  // CommandAuthorizationTable::Default().
  explicit CommandQueue(size_t max_size = kDefaultMaxQueueSize,
                        std::shared_ptr<telemetry::ITelemetrySink> telemetry = nullptr,
                        std::shared_ptr<const CommandAuthorizationTable> authorization = nullptr);

  // Disable copy (queue owns its buckets)
  CommandQueue(const CommandQueue&) = delete;
  CommandQueue& operator=(const CommandQueue&) = delete;

  // ==========================================================================
  // Admission
  // ==========================================================================

  // 1. Invalid priority throws std::invalid_argument.
  // 2. Unauthorized type/priority pairs are dropped with a warning
  //    (reason "queue").
  // 3. The payload is snapshotted.
  // 4. At capacity: "CommandQueueOverflow", then either the oldest entry of
  //    the lowest non-empty lane is evicted ("CommandDropped"), when that lane
  //    is strictly lower priority than the incoming command, or the incoming
  //    command is refused ("CommandRejected").
  EnqueueOutcome Enqueue(const Command& command);

  // ==========================================================================
  // Draining
  // ==========================================================================

  // Every entry, SYSTEM → PLAYER → AUTOMATION, FIFO within a lane.
  std::vector<CommandSnapshot> DequeueAll();

  // As DequeueAll() but only entries with step <= `step`. Later entries stay
  // queued in their original order.
  std::vector<CommandSnapshot> DequeueUpToStep(int64_t step);

  // ==========================================================================
  // Query / reset
  // ==========================================================================

  size_t Size() const { return size_; }
  bool Empty() const { return size_ == 0; }
  size_t SizeOf(CommandPriority priority) const;
  size_t MaxSize() const { return max_size_; }

  // Drops every entry without telemetry.
  void Clear();

 private:
  using Bucket = std::deque<QueueEntry>;

  // Index of the lowest-priority non-empty bucket. Requires size_ > 0.
  size_t LowestNonEmptyBucket() const;

  const size_t max_size_;
  const std::shared_ptr<telemetry::ITelemetrySink> telemetry_;
  const std::shared_ptr<const CommandAuthorizationTable> authorization_;

  std::array<Bucket, kCommandPriorityCount> buckets_;
  size_t size_ = 0;
  uint64_t next_sequence_ = 0;
};

}  // namespace simcore::command

#endif  // SIMCORE_COMMAND_COMMAND_QUEUE_HPP_
