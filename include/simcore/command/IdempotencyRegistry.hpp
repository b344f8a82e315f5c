// Repository: simcore
// Component: Idempotency Registry
// Purpose: TTL-bounded record of responses keyed by client and request id.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_COMMAND_IDEMPOTENCY_REGISTRY_HPP_
#define SIMCORE_COMMAND_IDEMPOTENCY_REGISTRY_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>

#include "simcore/command/CommandTransport.hpp"

namespace simcore::command {

inline constexpr int64_t kDefaultIdempotencyTtlMs = 5 * 60 * 1000;

struct IdempotencyKey {
  std::string client_id;
  std::string request_id;

  // "client_id:request_id"
  std::string ToString() const { return client_id + ":" + request_id; }

  bool operator<(const IdempotencyKey& other) const {
    return std::tie(client_id, request_id) < std::tie(other.client_id, other.request_id);
  }
  bool operator==(const IdempotencyKey& other) const {
    return client_id == other.client_id && request_id == other.request_id;
  }
};

// Consulted by the transport boundary so a retried submission is answered
// with the recorded outcome instead of executing twice.
class IIdempotencyRegistry {
 public:
  virtual ~IIdempotencyRegistry() = default;

  // Stores or overwrites.
  virtual void Record(const IdempotencyKey& key, const CommandResponse& response,
                      int64_t now_ms) = 0;
  // Entry as stored, or nullopt if absent or purged.
  virtual std::optional<CommandResponse> Get(const IdempotencyKey& key) const = 0;
  // Also treats an entry with recorded_at + ttl <= now_ms as absent.
  virtual std::optional<CommandResponse> Get(const IdempotencyKey& key,
                                             int64_t now_ms) const = 0;
  // Drops entries with recorded_at + ttl <= now_ms.
  virtual void PurgeExpired(int64_t now_ms) = 0;
  virtual size_t Size() const = 0;
};

class InMemoryIdempotencyRegistry final : public IIdempotencyRegistry {
 public:
  // A non-positive ttl falls back to kDefaultIdempotencyTtlMs.
  explicit InMemoryIdempotencyRegistry(int64_t ttl_ms = kDefaultIdempotencyTtlMs);

  void Record(const IdempotencyKey& key, const CommandResponse& response,
              int64_t now_ms) override;
  std::optional<CommandResponse> Get(const IdempotencyKey& key) const override;
  std::optional<CommandResponse> Get(const IdempotencyKey& key,
                                     int64_t now_ms) const override;
  void PurgeExpired(int64_t now_ms) override;
  size_t Size() const override { return entries_.size(); }

  int64_t ttl_ms() const { return ttl_ms_; }

 private:
  struct Entry {
    CommandResponse response;
    int64_t recorded_at_ms;
  };

  bool IsExpired(const Entry& entry, int64_t now_ms) const {
    return entry.recorded_at_ms + ttl_ms_ <= now_ms;
  }

  const int64_t ttl_ms_;
  std::map<IdempotencyKey, Entry> entries_;
};

}  // namespace simcore::command

#endif  // SIMCORE_COMMAND_IDEMPOTENCY_REGISTRY_HPP_
