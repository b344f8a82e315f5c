// Repository: simcore
// Component: Runtime Config
// Purpose: Step cadence, queue capacity and idempotency TTL settings.
// Copyright (c) 2025 simcore

#include "simcore/runtime/RuntimeConfig.hpp"

#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace simcore::runtime {

namespace {

std::optional<int64_t> ReadIntegerEnv(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') return std::nullopt;
  const std::string text(raw);
  size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text +
                                "'");
  }
  if (consumed != text.size()) {
    throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text +
                                "'");
  }
  return static_cast<int64_t>(value);
}

}  // namespace

RuntimeConfig RuntimeConfig::FromEnvironment() {
  RuntimeConfig config;
  if (auto v = ReadIntegerEnv("SIMCORE_STEP_SIZE_MS")) {
    config.step_size_ms = *v;
  }
  if (auto v = ReadIntegerEnv("SIMCORE_MAX_STEPS_PER_FRAME")) {
    if (*v < std::numeric_limits<int32_t>::min() || *v > std::numeric_limits<int32_t>::max()) {
      throw std::invalid_argument("SIMCORE_MAX_STEPS_PER_FRAME is out of range, got " +
                                  std::to_string(*v));
    }
    config.max_steps_per_frame = static_cast<int32_t>(*v);
  }
  if (auto v = ReadIntegerEnv("SIMCORE_MAX_COMMAND_QUEUE_SIZE")) {
    if (*v <= 0) {
      throw std::invalid_argument("SIMCORE_MAX_COMMAND_QUEUE_SIZE must be positive");
    }
    config.max_command_queue_size = static_cast<size_t>(*v);
  }
  if (auto v = ReadIntegerEnv("SIMCORE_IDEMPOTENCY_TTL_MS")) {
    config.idempotency_ttl_ms = *v;
  }
  return config;
}

void RuntimeConfig::Validate() const {
  if (step_size_ms <= 0) {
    throw std::invalid_argument("step_size_ms must be positive, got " +
                                std::to_string(step_size_ms));
  }
  if (max_steps_per_frame <= 0) {
    throw std::invalid_argument("max_steps_per_frame must be positive, got " +
                                std::to_string(max_steps_per_frame));
  }
  if (max_command_queue_size == 0) {
    throw std::invalid_argument("max_command_queue_size must be positive");
  }
  if (idempotency_ttl_ms <= 0) {
    throw std::invalid_argument("idempotency_ttl_ms must be positive, got " +
                                std::to_string(idempotency_ttl_ms));
  }
  if (initial_step < 0) {
    throw std::invalid_argument("initial_step must not be negative, got " +
                                std::to_string(initial_step));
  }
}

}  // namespace simcore::runtime
