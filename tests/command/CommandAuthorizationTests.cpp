// Repository: simcore
// Component: Command authorization table tests

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "fixtures/TelemetrySinkStub.h"
#include "simcore/command/CommandAuthorization.hpp"

namespace simcore::command {
namespace {

using tests::fixtures::TelemetrySinkStub;

// -----------------------------------------------------------------------------
// Priority helpers
// -----------------------------------------------------------------------------
TEST(CommandPriorityTest, NamesAndOrder) {
  EXPECT_STREQ(CommandPriorityToString(CommandPriority::kSystem), "SYSTEM");
  EXPECT_STREQ(CommandPriorityToString(CommandPriority::kPlayer), "PLAYER");
  EXPECT_STREQ(CommandPriorityToString(CommandPriority::kAutomation), "AUTOMATION");
  EXPECT_EQ(kCommandPriorityOrder[0], CommandPriority::kSystem);
  EXPECT_EQ(kCommandPriorityOrder[2], CommandPriority::kAutomation);
}

TEST(CommandPriorityTest, OutOfRangeValuesAreRejected) {
  EXPECT_EQ(CommandPriorityFromInt(1), CommandPriority::kPlayer);
  EXPECT_THROW(CommandPriorityFromInt(3), std::invalid_argument);
  EXPECT_THROW(CommandPriorityFromInt(-1), std::invalid_argument);
  EXPECT_FALSE(IsValidCommandPriority(static_cast<CommandPriority>(7)));
}

// -----------------------------------------------------------------------------
// Default table
// -----------------------------------------------------------------------------
TEST(CommandAuthorizationTest, DefaultTableCoversEveryRuntimeType) {
  const CommandAuthorizationTable& table = *CommandAuthorizationTable::Default();
  EXPECT_EQ(table.Size(), 18u);

  const AuthorizationPolicy* prestige = table.Find(command_types::kPrestigeReset);
  ASSERT_NE(prestige, nullptr);
  EXPECT_TRUE(prestige->Allows(CommandPriority::kPlayer));
  EXPECT_FALSE(prestige->Allows(CommandPriority::kAutomation));
  EXPECT_EQ(prestige->UnauthorizedEvent(), "AutomationPrestigeBlocked");

  const AuthorizationPolicy* catchup = table.Find(command_types::kOfflineCatchup);
  ASSERT_NE(catchup, nullptr);
  EXPECT_EQ(catchup->allowed_priorities, std::vector<CommandPriority>{CommandPriority::kSystem});
  EXPECT_EQ(catchup->UnauthorizedEvent(), kDefaultUnauthorizedEvent);

  for (const auto& [type, policy] : table) {
    EXPECT_FALSE(policy.allowed_priorities.empty()) << type;
    EXPECT_FALSE(policy.rationale.empty()) << type;
  }
}

TEST(CommandAuthorizationTest, UnknownTypesAreAuthorized) {
  TelemetrySinkStub sink;
  EXPECT_TRUE(CommandAuthorizationTable::Default()->Authorize(
      "SOMETHING_NEW", CommandPriority::kAutomation, sink));
  EXPECT_TRUE(sink.Records().empty());
}

// -----------------------------------------------------------------------------
// Violation telemetry
// -----------------------------------------------------------------------------
TEST(CommandAuthorizationTest, ViolationRecordsWarningWithContext) {
  TelemetrySinkStub sink;
  AuthorizationContext context;
  context.phase = AuthorizationPhase::kReplay;
  context.reason = "dispatcher";

  EXPECT_FALSE(CommandAuthorizationTable::Default()->Authorize(
      command_types::kPrestigeReset, CommandPriority::kAutomation, sink, context));

  auto warnings = sink.Warnings();
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].event, "AutomationPrestigeBlocked");
  const auto& data = warnings[0].data;
  EXPECT_EQ(data.at("type").AsString(), "PRESTIGE_RESET");
  EXPECT_EQ(data.at("attemptedPriority").AsString(), "AUTOMATION");
  EXPECT_EQ(data.at("allowedPriorities").AsStringList(),
            (std::vector<std::string>{"SYSTEM", "PLAYER"}));
  EXPECT_EQ(data.at("phase").AsString(), "replay");
  EXPECT_EQ(data.at("reason").AsString(), "dispatcher");
}

TEST(CommandAuthorizationTest, ReasonIsOmittedWhenUnset) {
  TelemetrySinkStub sink;
  EXPECT_FALSE(CommandAuthorizationTable::Default()->Authorize(
      command_types::kAddEntity, CommandPriority::kPlayer, sink));

  auto warnings = sink.Warnings();
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].event, "CommandPriorityViolation");
  EXPECT_EQ(warnings[0].data.count("reason"), 0u);
  EXPECT_EQ(warnings[0].data.at("phase").AsString(), "live");
}

// -----------------------------------------------------------------------------
// Table validation
// -----------------------------------------------------------------------------
TEST(CommandAuthorizationTest, InvalidPoliciesAreRejected) {
  EXPECT_THROW(CommandAuthorizationTable({{"", {CommandPriority::kSystem}, "r", {}}}),
               std::invalid_argument);
  EXPECT_THROW(CommandAuthorizationTable({{"A", {}, "r", {}}}), std::invalid_argument);
  EXPECT_THROW(
      CommandAuthorizationTable({{"A", {static_cast<CommandPriority>(9)}, "r", {}}}),
      std::invalid_argument);
  EXPECT_THROW(CommandAuthorizationTable({{"A", {CommandPriority::kSystem}, "r", {}},
                                          {"A", {CommandPriority::kPlayer}, "r", {}}}),
               std::invalid_argument);
}

TEST(CommandAuthorizationTest, CustomTableUsesCustomEvent) {
  CommandAuthorizationTable table(
      {{"SPAWN", {CommandPriority::kSystem}, "Spawning is system only.",
        std::string("SpawnBlocked")}});
  TelemetrySinkStub sink;

  EXPECT_TRUE(table.Authorize("SPAWN", CommandPriority::kSystem, sink));
  EXPECT_FALSE(table.Authorize("SPAWN", CommandPriority::kPlayer, sink));
  EXPECT_EQ(sink.Count(tests::fixtures::TelemetryLevel::WARNING, "SpawnBlocked"), 1u);
}

}  // namespace
}  // namespace simcore::command
