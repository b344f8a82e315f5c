// Repository: simcore
// Component: Idempotency Registry
// Purpose: TTL-bounded record of responses keyed by client and request id.
// Copyright (c) 2025 simcore

#include "simcore/command/IdempotencyRegistry.hpp"

namespace simcore::command {

InMemoryIdempotencyRegistry::InMemoryIdempotencyRegistry(int64_t ttl_ms)
    : ttl_ms_(ttl_ms > 0 ? ttl_ms : kDefaultIdempotencyTtlMs) {}

void InMemoryIdempotencyRegistry::Record(const IdempotencyKey& key,
                                         const CommandResponse& response,
                                         int64_t now_ms) {
  entries_.insert_or_assign(key, Entry{response, now_ms});
}

std::optional<CommandResponse> InMemoryIdempotencyRegistry::Get(
    const IdempotencyKey& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second.response;
}

std::optional<CommandResponse> InMemoryIdempotencyRegistry::Get(const IdempotencyKey& key,
                                                                int64_t now_ms) const {
  auto it = entries_.find(key);
  if (it == entries_.end() || IsExpired(it->second, now_ms)) return std::nullopt;
  return it->second.response;
}

void InMemoryIdempotencyRegistry::PurgeExpired(int64_t now_ms) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (IsExpired(it->second, now_ms)) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace simcore::command
