// Repository: simcore
// Component: Command queue tests

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "fixtures/TelemetrySinkStub.h"
#include "simcore/command/CommandQueue.hpp"
#include "simcore/snapshot/Snapshot.hpp"

namespace simcore::command {
namespace {

using tests::fixtures::TelemetryLevel;
using tests::fixtures::TelemetrySinkStub;

Command MakeCommand(const std::string& type, CommandPriority priority, int64_t step = 0,
                    int64_t timestamp = 0) {
  Command command;
  command.type = type;
  command.priority = priority;
  command.step = step;
  command.timestamp = timestamp;
  return command;
}

std::vector<std::string> Types(const std::vector<CommandSnapshot>& commands) {
  std::vector<std::string> types;
  for (const auto& command : commands) {
    types.push_back(command.type);
  }
  return types;
}

class CommandQueueTest : public ::testing::Test {
 protected:
  void SetUp() override { sink_ = std::make_shared<TelemetrySinkStub>(); }

  std::shared_ptr<TelemetrySinkStub> sink_;
};

// -----------------------------------------------------------------------------
// Ordering
// -----------------------------------------------------------------------------
TEST_F(CommandQueueTest, DrainsByPriorityThenArrival) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  queue.Enqueue(MakeCommand("a1", CommandPriority::kAutomation));
  queue.Enqueue(MakeCommand("p1", CommandPriority::kPlayer));
  queue.Enqueue(MakeCommand("s1", CommandPriority::kSystem));
  queue.Enqueue(MakeCommand("a2", CommandPriority::kAutomation));
  queue.Enqueue(MakeCommand("p2", CommandPriority::kPlayer));
  queue.Enqueue(MakeCommand("s2", CommandPriority::kSystem));

  EXPECT_EQ(queue.Size(), 6u);
  EXPECT_EQ(queue.SizeOf(CommandPriority::kPlayer), 2u);

  auto drained = queue.DequeueAll();
  EXPECT_EQ(Types(drained),
            (std::vector<std::string>{"s1", "s2", "p1", "p2", "a1", "a2"}));
  EXPECT_TRUE(queue.Empty());
  EXPECT_TRUE(queue.DequeueAll().empty()) << "Each command is drained exactly once";
}

TEST_F(CommandQueueTest, TimestampsDoNotAffectOrder) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  queue.Enqueue(MakeCommand("late", CommandPriority::kPlayer, 0, 500));
  queue.Enqueue(MakeCommand("early", CommandPriority::kPlayer, 0, 100));

  EXPECT_EQ(Types(queue.DequeueAll()), (std::vector<std::string>{"late", "early"}));
}

// -----------------------------------------------------------------------------
// Admission
// -----------------------------------------------------------------------------
TEST_F(CommandQueueTest, PayloadIsSnapshottedOnEnqueue) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  Command command = MakeCommand(command_types::kPurchaseGenerator, CommandPriority::kPlayer);
  command.payload = payload::Record{{"generatorId", "mine"}, {"count", 1}};

  ASSERT_EQ(queue.Enqueue(command), EnqueueOutcome::kAccepted);
  command.payload.AsRecord()["count"] = 50;
  command.payload.AsRecord()["generatorId"] = "farm";

  auto drained = queue.DequeueAll();
  ASSERT_EQ(drained.size(), 1u);
  EXPECT_EQ(drained[0].payload.Get("count").AsNumber(), 1.0);
  EXPECT_EQ(drained[0].payload.Get("generatorId").AsString(), "mine");
  EXPECT_THROW(drained[0].payload.AsRecord().Set("count", 2), snapshot::ImmutableSnapshotError);
}

TEST_F(CommandQueueTest, InvalidPriorityThrows) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  EXPECT_THROW(queue.Enqueue(MakeCommand("X", static_cast<CommandPriority>(5))),
               std::invalid_argument);
  EXPECT_TRUE(queue.Empty());
}

TEST_F(CommandQueueTest, UnauthorizedCommandIsDroppedWithQueueReason) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  EXPECT_EQ(queue.Enqueue(MakeCommand(command_types::kPrestigeReset,
                                      CommandPriority::kAutomation)),
            EnqueueOutcome::kUnauthorized);
  EXPECT_TRUE(queue.Empty());

  auto warnings = sink_->Warnings();
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].event, "AutomationPrestigeBlocked");
  EXPECT_EQ(warnings[0].data.at("reason").AsString(), "queue");
  EXPECT_EQ(warnings[0].data.at("phase").AsString(), "live");
}

TEST_F(CommandQueueTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(CommandQueue(0, sink_), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Capacity
// -----------------------------------------------------------------------------
TEST_F(CommandQueueTest, EvictsOldestLowerPriorityEntryAtCapacity) {
  CommandQueue queue(2, sink_);
  queue.Enqueue(MakeCommand("a", CommandPriority::kSystem));
  queue.Enqueue(MakeCommand("b", CommandPriority::kAutomation, 0, 42));

  EXPECT_EQ(queue.Enqueue(MakeCommand("c", CommandPriority::kPlayer)),
            EnqueueOutcome::kAcceptedWithEviction);
  EXPECT_EQ(queue.Size(), 2u);

  auto warnings = sink_->Warnings();
  ASSERT_EQ(warnings.size(), 2u);
  EXPECT_EQ(warnings[0].event, "CommandQueueOverflow");
  EXPECT_EQ(warnings[0].data.at("size").AsInt(), 2);
  EXPECT_EQ(warnings[0].data.at("maxSize").AsInt(), 2);
  EXPECT_EQ(warnings[0].data.at("priority").AsString(), "PLAYER");
  EXPECT_EQ(warnings[1].event, "CommandDropped");
  EXPECT_EQ(warnings[1].data.at("type").AsString(), "b");
  EXPECT_EQ(warnings[1].data.at("priority").AsString(), "AUTOMATION");
  EXPECT_EQ(warnings[1].data.at("timestamp").AsInt(), 42);

  EXPECT_EQ(Types(queue.DequeueAll()), (std::vector<std::string>{"a", "c"}));
}

TEST_F(CommandQueueTest, RejectsIncomingWhenNoLowerPriorityEntryExists) {
  CommandQueue queue(2, sink_);
  queue.Enqueue(MakeCommand("s", CommandPriority::kSystem));
  queue.Enqueue(MakeCommand("p", CommandPriority::kPlayer));

  EXPECT_EQ(queue.Enqueue(MakeCommand("p2", CommandPriority::kPlayer, 0, 7)),
            EnqueueOutcome::kRejectedAtCapacity);
  EXPECT_EQ(queue.Enqueue(MakeCommand("a", CommandPriority::kAutomation)),
            EnqueueOutcome::kRejectedAtCapacity);

  EXPECT_EQ(sink_->Count(TelemetryLevel::WARNING, "CommandQueueOverflow"), 2u);
  EXPECT_EQ(sink_->Count(TelemetryLevel::WARNING, "CommandRejected"), 2u);
  EXPECT_EQ(sink_->Count(TelemetryLevel::WARNING, "CommandDropped"), 0u);

  auto rejected = sink_->Warnings()[1];
  EXPECT_EQ(rejected.event, "CommandRejected");
  EXPECT_EQ(rejected.data.at("type").AsString(), "p2");
  EXPECT_EQ(rejected.data.at("timestamp").AsInt(), 7);
  EXPECT_EQ(rejected.data.at("maxSize").AsInt(), 2);

  EXPECT_EQ(Types(queue.DequeueAll()), (std::vector<std::string>{"s", "p"}));
}

TEST_F(CommandQueueTest, SystemCommandEvictsThroughFullPlayerLane) {
  CommandQueue queue(2, sink_);
  queue.Enqueue(MakeCommand("p1", CommandPriority::kPlayer));
  queue.Enqueue(MakeCommand("p2", CommandPriority::kPlayer));

  EXPECT_EQ(queue.Enqueue(MakeCommand("s", CommandPriority::kSystem)),
            EnqueueOutcome::kAcceptedWithEviction);
  EXPECT_EQ(Types(queue.DequeueAll()), (std::vector<std::string>{"s", "p2"}));
}

// -----------------------------------------------------------------------------
// Step filtering
// -----------------------------------------------------------------------------
TEST_F(CommandQueueTest, DequeueUpToStepKeepsLaterCommandsInOrder) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  queue.Enqueue(MakeCommand("p5", CommandPriority::kPlayer, 5));
  queue.Enqueue(MakeCommand("p3", CommandPriority::kPlayer, 3));
  queue.Enqueue(MakeCommand("s4", CommandPriority::kSystem, 4));
  queue.Enqueue(MakeCommand("a6", CommandPriority::kAutomation, 6));
  queue.Enqueue(MakeCommand("p4", CommandPriority::kPlayer, 4));

  EXPECT_TRUE(queue.DequeueUpToStep(2).empty());
  EXPECT_EQ(Types(queue.DequeueUpToStep(4)), (std::vector<std::string>{"s4", "p3", "p4"}));
  EXPECT_EQ(queue.Size(), 2u);
  EXPECT_EQ(Types(queue.DequeueUpToStep(5)), (std::vector<std::string>{"p5"}));
  EXPECT_EQ(Types(queue.DequeueAll()), (std::vector<std::string>{"a6"}));
}

TEST_F(CommandQueueTest, DequeueUpToStepIncludesNegativeAndZeroBoundaries) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  queue.Enqueue(MakeCommand("zero", CommandPriority::kPlayer, 0));
  queue.Enqueue(MakeCommand("minus_one", CommandPriority::kPlayer, -1));
  queue.Enqueue(MakeCommand("one", CommandPriority::kSystem, 1));

  EXPECT_TRUE(queue.DequeueUpToStep(-2).empty());
  EXPECT_EQ(Types(queue.DequeueUpToStep(-1)), (std::vector<std::string>{"minus_one"}));
  EXPECT_EQ(Types(queue.DequeueUpToStep(0)), (std::vector<std::string>{"zero"}));
  ASSERT_EQ(queue.Size(), 1u) << "Later command stays queued";
  EXPECT_EQ(Types(queue.DequeueUpToStep(1)), (std::vector<std::string>{"one"}));
  EXPECT_TRUE(queue.Empty());
}

TEST_F(CommandQueueTest, ClearDropsEverythingSilently) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_);
  queue.Enqueue(MakeCommand("s", CommandPriority::kSystem));
  queue.Clear();

  EXPECT_TRUE(queue.Empty());
  EXPECT_TRUE(sink_->Records().empty());
}

// -----------------------------------------------------------------------------
// Authorization table ownership
// -----------------------------------------------------------------------------
TEST_F(CommandQueueTest, KeepsInjectedTableAlive) {
  std::unique_ptr<CommandQueue> queue;
  {
    auto table = std::make_shared<const CommandAuthorizationTable>(
        std::vector<AuthorizationPolicy>{
            {"SPAWN", {CommandPriority::kSystem}, "system only", {}}});
    queue = std::make_unique<CommandQueue>(kDefaultMaxQueueSize, sink_, table);
  }

  EXPECT_EQ(queue->Enqueue(MakeCommand("SPAWN", CommandPriority::kPlayer)),
            EnqueueOutcome::kUnauthorized);
  EXPECT_EQ(queue->Enqueue(MakeCommand("SPAWN", CommandPriority::kSystem)),
            EnqueueOutcome::kAccepted);
  EXPECT_EQ(queue->Size(), 1u);
}

TEST_F(CommandQueueTest, NullTableFallsBackToDefaultPolicies) {
  CommandQueue queue(kDefaultMaxQueueSize, sink_, nullptr);
  EXPECT_EQ(queue.Enqueue(MakeCommand(command_types::kOfflineCatchup, CommandPriority::kPlayer)),
            EnqueueOutcome::kUnauthorized);
}

TEST(CommandQueueDefaultsTest, WorksWithoutTelemetry) {
  CommandQueue queue;
  EXPECT_EQ(queue.MaxSize(), kDefaultMaxQueueSize);
  EXPECT_EQ(queue.Enqueue(MakeCommand(command_types::kAddEntity, CommandPriority::kPlayer)),
            EnqueueOutcome::kUnauthorized);
  EXPECT_STREQ(EnqueueOutcomeToString(EnqueueOutcome::kRejectedAtCapacity),
               "REJECTED_AT_CAPACITY");
}

}  // namespace
}  // namespace simcore::command
