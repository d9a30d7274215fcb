#pragma once
#include "time/ITimeSource.hpp"
#include <chrono>

namespace seedling {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace seedling
