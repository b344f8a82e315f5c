// Repository: simcore
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for the simulation core.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_UTIL_LOGGER_HPP_
#define SIMCORE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace simcore::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when SIMCORE_DEBUG env is set
// Warn  → stderr (rejected commands, evictions, authorization violations)
// Error → stderr (handler failures, unknown command types)
//
// Test-only: the Set*Sink functions install a callback invoked for every line
// of that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace simcore::util

#endif  // SIMCORE_UTIL_LOGGER_HPP_
