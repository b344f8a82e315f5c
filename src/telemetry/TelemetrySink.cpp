// Repository: simcore
// Component: Telemetry Sink
// Purpose: No-op and logging sink implementations.
// Copyright (c) 2025 simcore

#include "simcore/telemetry/TelemetrySink.hpp"

#include <sstream>

#include "simcore/util/Logger.hpp"

namespace simcore::telemetry {

std::string TelemetryValue::ToString() const {
  std::ostringstream oss;
  if (IsBool()) {
    oss << (AsBool() ? "true" : "false");
  } else if (IsInt()) {
    oss << AsInt();
  } else if (IsDouble()) {
    oss << AsDouble();
  } else if (IsString()) {
    oss << AsString();
  } else {
    oss << "[";
    const auto& items = AsStringList();
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) oss << ",";
      oss << items[i];
    }
    oss << "]";
  }
  return oss.str();
}

std::shared_ptr<ITelemetrySink> NullTelemetry() {
  static const std::shared_ptr<ITelemetrySink> instance =
      std::make_shared<NullTelemetrySink>();
  return instance;
}

std::shared_ptr<ITelemetrySink> OrNullTelemetry(std::shared_ptr<ITelemetrySink> sink) {
  if (sink) return sink;
  return NullTelemetry();
}

// =============================================================================
// LoggingTelemetrySink
// =============================================================================

std::string LoggingTelemetrySink::FormatLine(const char* level,
                                             const std::string& event,
                                             const TelemetryData& data) {
  std::ostringstream oss;
  oss << "[telemetry:" << level << "] " << event;
  for (const auto& [key, value] : data) {
    oss << " " << key << "=" << value.ToString();
  }
  return oss.str();
}

void LoggingTelemetrySink::RecordError(const std::string& event,
                                       const TelemetryData& data) {
  util::Logger::Error(FormatLine("error", event, data));
}

void LoggingTelemetrySink::RecordWarning(const std::string& event,
                                         const TelemetryData& data) {
  util::Logger::Warn(FormatLine("warning", event, data));
}

void LoggingTelemetrySink::RecordProgress(const std::string& event,
                                          const TelemetryData& data) {
  util::Logger::Info(FormatLine("progress", event, data));
}

void LoggingTelemetrySink::RecordCounters(const std::string& group,
                                          const TelemetryCounters& counters) {
  if (!util::Logger::DebugEnabled()) return;
  std::ostringstream oss;
  oss << "[telemetry:counters] " << group;
  for (const auto& [key, value] : counters) {
    oss << " " << key << "=" << value;
  }
  util::Logger::Debug(oss.str());
}

void LoggingTelemetrySink::RecordTick() {
  util::Logger::Debug("[telemetry:tick]");
}

}  // namespace simcore::telemetry
