// Repository: Seedling
// Component: Presentation Sink Interface
// Purpose: Receives recording lifecycle, transcript and level updates.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_RUNTIME_I_PRESENTATION_SINK_HPP_
#define SEEDLING_RUNTIME_I_PRESENTATION_SINK_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace seedling::runtime {

// All methods are invoked on the main loop.
class IPresentationSink {
 public:
  virtual ~IPresentationSink() = default;

  virtual void OnRecordingStarted() = 0;
  virtual void OnTranscriptUpdate(const std::string& text) = 0;
  // Raw captured samples, for level meters.
  virtual void OnSamples(const std::vector<int16_t>& samples) = 0;
  // `text` is empty when cancelled.
  virtual void OnRecordingEnded(const std::string& text, bool cancelled) = 0;
};

}  // namespace seedling::runtime

#endif  // SEEDLING_RUNTIME_I_PRESENTATION_SINK_HPP_
