// Repository: simcore
// Component: Telemetry Sink
// Purpose: Pluggable recorder for error/warning/progress/counter/tick events.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_TELEMETRY_TELEMETRY_SINK_HPP_
#define SIMCORE_TELEMETRY_TELEMETRY_SINK_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace simcore::telemetry {

// =============================================================================
// TelemetryValue
// One field of a telemetry event. The constructor set is closed so that
// string literals and integer literals land on the intended alternative.
// =============================================================================

class TelemetryValue {
 public:
  using Storage =
      std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

  TelemetryValue(bool value) : storage_(value) {}
  TelemetryValue(int value) : storage_(static_cast<int64_t>(value)) {}
  TelemetryValue(int64_t value) : storage_(value) {}
  TelemetryValue(uint64_t value) : storage_(static_cast<int64_t>(value)) {}
  TelemetryValue(double value) : storage_(value) {}
  TelemetryValue(const char* value) : storage_(std::string(value)) {}
  TelemetryValue(std::string value) : storage_(std::move(value)) {}
  TelemetryValue(std::vector<std::string> value) : storage_(std::move(value)) {}

  bool IsBool() const { return std::holds_alternative<bool>(storage_); }
  bool IsInt() const { return std::holds_alternative<int64_t>(storage_); }
  bool IsDouble() const { return std::holds_alternative<double>(storage_); }
  bool IsString() const { return std::holds_alternative<std::string>(storage_); }
  bool IsStringList() const {
    return std::holds_alternative<std::vector<std::string>>(storage_);
  }

  bool AsBool() const { return std::get<bool>(storage_); }
  int64_t AsInt() const { return std::get<int64_t>(storage_); }
  double AsDouble() const { return std::get<double>(storage_); }
  const std::string& AsString() const { return std::get<std::string>(storage_); }
  const std::vector<std::string>& AsStringList() const {
    return std::get<std::vector<std::string>>(storage_);
  }

  // Rendering used by log lines: lists as [a,b], strings unquoted.
  std::string ToString() const;

  const Storage& storage() const { return storage_; }

  bool operator==(const TelemetryValue& other) const {
    return storage_ == other.storage_;
  }
  bool operator!=(const TelemetryValue& other) const { return !(*this == other); }

 private:
  Storage storage_;
};

using TelemetryData = std::map<std::string, TelemetryValue>;
using TelemetryCounters = std::map<std::string, double>;

// =============================================================================
// ITelemetrySink
// Every component reports through this interface and never depends on an
// implementation. Implementations must not throw.
// =============================================================================

class ITelemetrySink {
 public:
  virtual ~ITelemetrySink() = default;

  virtual void RecordError(const std::string& event, const TelemetryData& data) = 0;
  virtual void RecordWarning(const std::string& event, const TelemetryData& data) = 0;
  virtual void RecordProgress(const std::string& event, const TelemetryData& data) = 0;
  virtual void RecordCounters(const std::string& group,
                              const TelemetryCounters& counters) = 0;
  virtual void RecordTick() = 0;
};

// No-op default sink.
class NullTelemetrySink final : public ITelemetrySink {
 public:
  void RecordError(const std::string&, const TelemetryData&) override {}
  void RecordWarning(const std::string&, const TelemetryData&) override {}
  void RecordProgress(const std::string&, const TelemetryData&) override {}
  void RecordCounters(const std::string&, const TelemetryCounters&) override {}
  void RecordTick() override {}
};

// Shared no-op instance handed out wherever a component is built without a sink.
std::shared_ptr<ITelemetrySink> NullTelemetry();

// Returns `sink` if set, otherwise NullTelemetry().
std::shared_ptr<ITelemetrySink> OrNullTelemetry(std::shared_ptr<ITelemetrySink> sink);

// Writes every event through util::Logger as
//   [telemetry:<level>] <event> key=value key=value
// Errors go to Logger::Error, warnings to Logger::Warn, progress to
// Logger::Info, counters and ticks to Logger::Debug.
class LoggingTelemetrySink final : public ITelemetrySink {
 public:
  void RecordError(const std::string& event, const TelemetryData& data) override;
  void RecordWarning(const std::string& event, const TelemetryData& data) override;
  void RecordProgress(const std::string& event, const TelemetryData& data) override;
  void RecordCounters(const std::string& group,
                      const TelemetryCounters& counters) override;
  void RecordTick() override;

  static std::string FormatLine(const char* level, const std::string& event,
                                const TelemetryData& data);
};

}  // namespace simcore::telemetry

#endif  // SIMCORE_TELEMETRY_TELEMETRY_SINK_HPP_
