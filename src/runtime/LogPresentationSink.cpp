// Repository: Seedling
// Component: Log Presentation Sink
// Purpose: Headless presentation: transcript and levels go to the log.
// Copyright (c) 2025 RetroVue

#include "seedling/runtime/LogPresentationSink.hpp"

#include <cmath>
#include <cstdio>

#include "seedling/util/Logger.hpp"

namespace seedling::runtime {

using util::Logger;

namespace {
// One level line per second of 16 kHz audio.
constexpr int64_t kLevelLogEverySamples = 16000;
}  // namespace

void LogPresentationSink::OnRecordingStarted() {
  samples_seen_ = 0;
  next_level_log_ = kLevelLogEverySamples;
  last_level_ = 0.0;
  Logger::Info("[Presentation] Listening...");
}

void LogPresentationSink::OnTranscriptUpdate(const std::string& text) {
  Logger::Info("[Presentation] ... " + text);
}

void LogPresentationSink::OnSamples(const std::vector<int16_t>& samples) {
  if (samples.empty()) return;
  double sum = 0.0;
  for (int16_t s : samples) {
    const double v = static_cast<double>(s) / 32768.0;
    sum += v * v;
  }
  last_level_ = std::sqrt(sum / static_cast<double>(samples.size()));
  samples_seen_ += static_cast<int64_t>(samples.size());
  if (samples_seen_ >= next_level_log_) {
    next_level_log_ += kLevelLogEverySamples;
    char buf[32];
    snprintf(buf, sizeof(buf), "%.3f", last_level_);
    Logger::Debug(std::string("[Presentation] level=") + buf);
  }
}

void LogPresentationSink::OnRecordingEnded(const std::string& text, bool cancelled) {
  if (cancelled) {
    Logger::Info("[Presentation] Cancelled");
  } else {
    Logger::Info("[Presentation] Final: " + text);
  }
}

}  // namespace seedling::runtime
