// Repository: simcore
// Component: Metrics exporter tests

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "fixtures/TelemetrySinkStub.h"
#include "simcore/telemetry/MetricsExporter.hpp"

namespace simcore::telemetry {
namespace {

using tests::fixtures::TelemetryLevel;
using tests::fixtures::TelemetrySinkStub;

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

// -----------------------------------------------------------------------------
// Aggregation
// -----------------------------------------------------------------------------
TEST(MetricsExporterTest, CountsEventsByLevelAndName) {
  MetricsExporter exporter;
  exporter.RecordWarning("CommandDropped", {});
  exporter.RecordWarning("CommandDropped", {});
  exporter.RecordWarning("CommandRejected", {});
  exporter.RecordError("UnknownCommandType", {});
  exporter.RecordProgress("StepCompleted", {});
  exporter.RecordTick();
  exporter.RecordTick();

  auto snapshot = exporter.SnapshotForTest();
  EXPECT_EQ(snapshot.warnings_by_event["CommandDropped"], 2u);
  EXPECT_EQ(snapshot.warnings_by_event["CommandRejected"], 1u);
  EXPECT_EQ(snapshot.errors_by_event["UnknownCommandType"], 1u);
  EXPECT_EQ(snapshot.progress_by_event["StepCompleted"], 1u);
  EXPECT_EQ(snapshot.ticks_total, 2u);
}

TEST(MetricsExporterTest, CountersKeepLastValue) {
  MetricsExporter exporter;
  exporter.RecordCounters("queue", {{"sizeBefore", 4}, {"executed", 3}});
  exporter.RecordCounters("queue", {{"sizeBefore", 1}});

  auto snapshot = exporter.SnapshotForTest();
  EXPECT_EQ((snapshot.counters[{"queue", "sizeBefore"}]), 1.0);
  EXPECT_EQ((snapshot.counters[{"queue", "executed"}]), 3.0);
}

TEST(MetricsExporterTest, ForwardsToDownstreamSink) {
  auto downstream = std::make_shared<TelemetrySinkStub>();
  MetricsExporter exporter(MetricsExporter::kDefaultPrefix, downstream);

  exporter.RecordWarning("CommandRejected", {{"type", "X"}});
  exporter.RecordCounters("queue", {{"captured", 2}});
  exporter.RecordTick();

  EXPECT_EQ(downstream->Count(TelemetryLevel::WARNING, "CommandRejected"), 1u);
  EXPECT_EQ(downstream->Counters("queue").at("captured"), 2.0);
  EXPECT_EQ(downstream->Ticks(), 1u);
}

// -----------------------------------------------------------------------------
// Exposition
// -----------------------------------------------------------------------------
TEST(MetricsExporterTest, GeneratesPrometheusText) {
  MetricsExporter exporter("sim_");
  exporter.RecordWarning("CommandQueueOverflow", {});
  exporter.RecordCounters("queue", {{"executed", 3}});
  exporter.RecordTick();

  const std::string text = exporter.GenerateMetricsText();
  EXPECT_TRUE(Contains(text, "# TYPE sim_telemetry_warnings_total counter\n")) << text;
  EXPECT_TRUE(Contains(text, "sim_telemetry_warnings_total{event=\"CommandQueueOverflow\"} 1\n"))
      << text;
  EXPECT_TRUE(Contains(text, "sim_runtime_ticks_total 1\n")) << text;
  EXPECT_TRUE(Contains(text, "sim_counter{group=\"queue\",name=\"executed\"} 3\n")) << text;
}

TEST(MetricsExporterTest, EscapesLabelValues) {
  MetricsExporter exporter;
  exporter.RecordError("bad\"name\\", {});

  EXPECT_TRUE(Contains(exporter.GenerateMetricsText(),
                       "simcore_telemetry_errors_total{event=\"bad\\\"name\\\\\"} 1"));
}

TEST(MetricsExporterTest, CustomProvidersAppendAndUnregister) {
  MetricsExporter exporter;
  exporter.RegisterCustomMetricsProvider("queue_depth", [] {
    return std::string("simcore_queue_depth 7\n");
  });
  EXPECT_TRUE(Contains(exporter.GenerateMetricsText(), "simcore_queue_depth 7\n"));

  exporter.UnregisterCustomMetricsProvider("queue_depth");
  EXPECT_FALSE(Contains(exporter.GenerateMetricsText(), "simcore_queue_depth"));
}

TEST(MetricsExporterTest, ResetClearsAggregatesButKeepsProviders) {
  MetricsExporter exporter;
  exporter.RegisterCustomMetricsProvider("extra", [] { return std::string("extra 1\n"); });
  exporter.RecordTick();
  exporter.RecordWarning("CommandDropped", {});

  exporter.Reset();

  auto snapshot = exporter.SnapshotForTest();
  EXPECT_EQ(snapshot.ticks_total, 0u);
  EXPECT_TRUE(snapshot.warnings_by_event.empty());
  EXPECT_TRUE(Contains(exporter.GenerateMetricsText(), "extra 1\n"));
}

}  // namespace
}  // namespace simcore::telemetry
