#pragma once
#include <cstdint>

namespace simcore::time {

// Wall-clock source for idempotency bookkeeping and command timestamps.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace simcore::time
