// Repository: simcore
// Component: Telemetry sink tests

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "simcore/telemetry/TelemetrySink.hpp"
#include "simcore/util/Logger.hpp"

namespace simcore::telemetry {
namespace {

// Routes Logger output into vectors for the lifetime of the test.
class LoggerCapture {
 public:
  LoggerCapture() {
    util::Logger::SetInfoSink([this](const std::string& line) { info.push_back(line); });
    util::Logger::SetWarnSink([this](const std::string& line) { warn.push_back(line); });
    util::Logger::SetErrorSink([this](const std::string& line) { error.push_back(line); });
  }
  ~LoggerCapture() {
    util::Logger::SetInfoSink(nullptr);
    util::Logger::SetWarnSink(nullptr);
    util::Logger::SetErrorSink(nullptr);
  }

  std::vector<std::string> info;
  std::vector<std::string> warn;
  std::vector<std::string> error;
};

// -----------------------------------------------------------------------------
// TelemetryValue
// -----------------------------------------------------------------------------
TEST(TelemetryValueTest, RendersEachKind) {
  EXPECT_EQ(TelemetryValue(true).ToString(), "true");
  EXPECT_EQ(TelemetryValue(42).ToString(), "42");
  EXPECT_EQ(TelemetryValue(1.5).ToString(), "1.5");
  EXPECT_EQ(TelemetryValue("queue").ToString(), "queue");
  EXPECT_EQ(TelemetryValue(std::vector<std::string>{"SYSTEM", "PLAYER"}).ToString(),
            "[SYSTEM,PLAYER]");
}

TEST(TelemetryValueTest, IntegerWidthsCompareEqual) {
  EXPECT_EQ(TelemetryValue(7), TelemetryValue(int64_t{7}));
  EXPECT_EQ(TelemetryValue(uint64_t{7}).AsInt(), 7);
  EXPECT_TRUE(TelemetryValue(uint64_t{7}).IsInt());
  EXPECT_NE(TelemetryValue(7), TelemetryValue(7.0));
}

// -----------------------------------------------------------------------------
// Null sink
// -----------------------------------------------------------------------------
TEST(NullTelemetryTest, SharedInstanceAndFallback) {
  auto null_sink = NullTelemetry();
  ASSERT_NE(null_sink, nullptr);
  EXPECT_EQ(null_sink, NullTelemetry());
  EXPECT_EQ(OrNullTelemetry(nullptr), null_sink);

  auto logging = std::make_shared<LoggingTelemetrySink>();
  EXPECT_EQ(OrNullTelemetry(logging), logging);

  null_sink->RecordError("Ignored", {{"k", 1}});
  null_sink->RecordTick();
}

// -----------------------------------------------------------------------------
// Logging sink
// -----------------------------------------------------------------------------
TEST(LoggingTelemetrySinkTest, FormatsEventAndSortedFields) {
  const std::string line = LoggingTelemetrySink::FormatLine(
      "warning", "CommandDropped",
      {{"type", "COLLECT_RESOURCE"}, {"priority", "AUTOMATION"}, {"timestamp", 9}});
  EXPECT_EQ(line,
            "[telemetry:warning] CommandDropped priority=AUTOMATION timestamp=9 "
            "type=COLLECT_RESOURCE");
}

TEST(LoggingTelemetrySinkTest, RoutesLevelsToLogger) {
  LoggerCapture capture;
  LoggingTelemetrySink sink;

  sink.RecordError("UnknownCommandType", {{"type", "NOPE"}});
  sink.RecordWarning("CommandQueueOverflow", {{"size", 2}});
  sink.RecordProgress("StepCompleted", {});

  ASSERT_EQ(capture.error.size(), 1u);
  EXPECT_EQ(capture.error[0], "[telemetry:error] UnknownCommandType type=NOPE");
  ASSERT_EQ(capture.warn.size(), 1u);
  EXPECT_EQ(capture.warn[0], "[telemetry:warning] CommandQueueOverflow size=2");
  ASSERT_EQ(capture.info.size(), 1u);
  EXPECT_EQ(capture.info[0], "[telemetry:progress] StepCompleted");
}

}  // namespace
}  // namespace simcore::telemetry
