#pragma once
#include <cstdint>

namespace seedling {

// Monotonic millisecond clock used for recording durations.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

}  // namespace seedling
