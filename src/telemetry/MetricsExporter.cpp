// Repository: simcore
// Component: Metrics Exporter
// Purpose: Aggregates telemetry events into Prometheus text exposition.
// Copyright (c) 2025 simcore

#include "simcore/telemetry/MetricsExporter.hpp"

#include <sstream>

namespace simcore::telemetry {

MetricsExporter::MetricsExporter(std::string prefix,
                                 std::shared_ptr<ITelemetrySink> downstream)
    : prefix_(std::move(prefix)), downstream_(std::move(downstream)) {}

void MetricsExporter::RecordError(const std::string& event,
                                  const TelemetryData& data) {
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++state_.errors_by_event[event];
  }
  if (downstream_) downstream_->RecordError(event, data);
}

void MetricsExporter::RecordWarning(const std::string& event,
                                    const TelemetryData& data) {
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++state_.warnings_by_event[event];
  }
  if (downstream_) downstream_->RecordWarning(event, data);
}

void MetricsExporter::RecordProgress(const std::string& event,
                                     const TelemetryData& data) {
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++state_.progress_by_event[event];
  }
  if (downstream_) downstream_->RecordProgress(event, data);
}

void MetricsExporter::RecordCounters(const std::string& group,
                                     const TelemetryCounters& counters) {
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    for (const auto& [name, value] : counters) {
      state_.counters[{group, name}] = value;
    }
  }
  if (downstream_) downstream_->RecordCounters(group, counters);
}

void MetricsExporter::RecordTick() {
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++state_.ticks_total;
  }
  if (downstream_) downstream_->RecordTick();
}

void MetricsExporter::RegisterCustomMetricsProvider(const std::string& name,
                                                    CustomMetricsProvider provider) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  custom_providers_[name] = std::move(provider);
}

void MetricsExporter::UnregisterCustomMetricsProvider(const std::string& name) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  custom_providers_.erase(name);
}

void MetricsExporter::Reset() {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  state_ = Snapshot{};
}

MetricsExporter::Snapshot MetricsExporter::SnapshotForTest() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  return state_;
}

std::string MetricsExporter::EscapeLabelValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n"; break;
      default:   out += c; break;
    }
  }
  return out;
}

std::string MetricsExporter::GenerateMetricsText() const {
  Snapshot state;
  std::map<std::string, CustomMetricsProvider> providers;
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    state = state_;
    providers = custom_providers_;
  }

  std::ostringstream oss;

  auto write_by_event = [&](const char* name, const char* help,
                            const std::map<std::string, uint64_t>& values) {
    oss << "# HELP " << prefix_ << name << " " << help << "\n";
    oss << "# TYPE " << prefix_ << name << " counter\n";
    for (const auto& [event, count] : values) {
      oss << prefix_ << name << "{event=\"" << EscapeLabelValue(event) << "\"} "
          << count << "\n";
    }
  };

  write_by_event("telemetry_errors_total",
                 "Telemetry error events by event name", state.errors_by_event);
  write_by_event("telemetry_warnings_total",
                 "Telemetry warning events by event name", state.warnings_by_event);
  write_by_event("telemetry_progress_total",
                 "Telemetry progress events by event name", state.progress_by_event);

  oss << "# HELP " << prefix_ << "runtime_ticks_total Simulation steps executed\n";
  oss << "# TYPE " << prefix_ << "runtime_ticks_total counter\n";
  oss << prefix_ << "runtime_ticks_total " << state.ticks_total << "\n";

  if (!state.counters.empty()) {
    oss << "# HELP " << prefix_ << "counter Last recorded value per counter group\n";
    oss << "# TYPE " << prefix_ << "counter gauge\n";
    for (const auto& [key, value] : state.counters) {
      oss << prefix_ << "counter{group=\"" << EscapeLabelValue(key.first)
          << "\",name=\"" << EscapeLabelValue(key.second) << "\"} " << value
          << "\n";
    }
  }

  for (const auto& [name, provider] : providers) {
    if (!provider) continue;
    oss << provider();
  }

  return oss.str();
}

}  // namespace simcore::telemetry
