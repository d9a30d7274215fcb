#pragma once
#include "time/ITimeSource.hpp"

#include <atomic>

namespace seedling {

// Manually advanced clock. Safe to advance from the test thread while the
// main loop reads it.
class DeterministicTimeSource : public ITimeSource {
public:
  explicit DeterministicTimeSource(int64_t start_ms = 0)
      : now_ms_(start_ms) {}

  int64_t NowMs() const override {
    return now_ms_.load(std::memory_order_acquire);
  }

  void AdvanceMs(int64_t delta) {
    now_ms_.fetch_add(delta, std::memory_order_acq_rel);
  }

  void SetMs(int64_t value) {
    now_ms_.store(value, std::memory_order_release);
  }

private:
  std::atomic<int64_t> now_ms_;
};

}  // namespace seedling
