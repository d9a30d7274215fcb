// Repository: Seedling
// Component: Log Presentation Sink
// Purpose: Headless presentation: transcript and levels go to the log.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_RUNTIME_LOG_PRESENTATION_SINK_HPP_
#define SEEDLING_RUNTIME_LOG_PRESENTATION_SINK_HPP_

#include <cstdint>
#include <string>

#include "seedling/runtime/IPresentationSink.hpp"

namespace seedling::runtime {

class LogPresentationSink : public IPresentationSink {
 public:
  void OnRecordingStarted() override;
  void OnTranscriptUpdate(const std::string& text) override;
  void OnSamples(const std::vector<int16_t>& samples) override;
  void OnRecordingEnded(const std::string& text, bool cancelled) override;

  // RMS of the most recent OnSamples() batch, 0..1.
  double last_level() const { return last_level_; }

 private:
  double last_level_ = 0.0;
  int64_t samples_seen_ = 0;
  int64_t next_level_log_ = 0;
};

}  // namespace seedling::runtime

#endif  // SEEDLING_RUNTIME_LOG_PRESENTATION_SINK_HPP_
