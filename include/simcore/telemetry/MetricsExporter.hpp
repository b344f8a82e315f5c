// Repository: simcore
// Component: Metrics Exporter
// Purpose: Aggregates telemetry events into Prometheus text exposition.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_TELEMETRY_METRICS_EXPORTER_HPP_
#define SIMCORE_TELEMETRY_METRICS_EXPORTER_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "simcore/telemetry/TelemetrySink.hpp"

namespace simcore::telemetry {

// MetricsExporter is a telemetry sink that counts what it records and renders
// the totals in Prometheus text format. An optional downstream sink receives
// every event unchanged (typically a LoggingTelemetrySink).
//
// Metrics Exported:
// - <prefix>telemetry_errors_total{event="E"}   - counter
// - <prefix>telemetry_warnings_total{event="E"} - counter
// - <prefix>telemetry_progress_total{event="E"} - counter
// - <prefix>runtime_ticks_total                 - counter
// - <prefix>counter{group="G",name="N"}         - gauge (last recorded value)
//
// All methods are thread-safe; a host may scrape from another thread while
// the simulation records.
class MetricsExporter final : public ITelemetrySink {
 public:
  static constexpr const char* kDefaultPrefix = "simcore_";

  struct Snapshot {
    std::map<std::string, uint64_t> errors_by_event;
    std::map<std::string, uint64_t> warnings_by_event;
    std::map<std::string, uint64_t> progress_by_event;
    std::map<std::pair<std::string, std::string>, double> counters;
    uint64_t ticks_total = 0;
  };

  explicit MetricsExporter(std::string prefix = kDefaultPrefix,
                           std::shared_ptr<ITelemetrySink> downstream = nullptr);

  MetricsExporter(const MetricsExporter&) = delete;
  MetricsExporter& operator=(const MetricsExporter&) = delete;

  void RecordError(const std::string& event, const TelemetryData& data) override;
  void RecordWarning(const std::string& event, const TelemetryData& data) override;
  void RecordProgress(const std::string& event, const TelemetryData& data) override;
  void RecordCounters(const std::string& group,
                      const TelemetryCounters& counters) override;
  void RecordTick() override;

  // Renders the full exposition, custom providers appended in name order.
  std::string GenerateMetricsText() const;

  // Register a supplementary provider that appends Prometheus-format text.
  // Provider must be thread-safe.
  using CustomMetricsProvider = std::function<std::string()>;
  void RegisterCustomMetricsProvider(const std::string& name,
                                     CustomMetricsProvider provider);
  void UnregisterCustomMetricsProvider(const std::string& name);

  // Clears all aggregates. Providers stay registered.
  void Reset();

  const std::string& prefix() const { return prefix_; }

  // Test helper.
  Snapshot SnapshotForTest() const;

 private:
  static std::string EscapeLabelValue(const std::string& value);

  const std::string prefix_;
  const std::shared_ptr<ITelemetrySink> downstream_;

  mutable std::mutex metrics_mutex_;
  Snapshot state_;
  std::map<std::string, CustomMetricsProvider> custom_providers_;
};

}  // namespace simcore::telemetry

#endif  // SIMCORE_TELEMETRY_METRICS_EXPORTER_HPP_
