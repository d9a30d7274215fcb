// Repository: Seedling
// Component: PortAudio Microphone Source
// Purpose: Captures the default input device as 16 kHz mono s16 PCM.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_AUDIO_PORT_AUDIO_SOURCE_HPP_
#define SEEDLING_AUDIO_PORT_AUDIO_SOURCE_HPP_

#include <atomic>
#include <thread>

#include "seedling/audio/IAudioSource.hpp"

namespace seedling::audio {

// Built only when SEEDLING_WITH_PORTAUDIO is enabled. The input stream is
// opened per recording and read on a dedicated capture thread with blocking
// Pa_ReadStream calls.
class PortAudioSource : public IAudioSource {
 public:
  static constexpr int kSampleRateHz = 16000;
  static constexpr unsigned long kFramesPerBuffer = 1600;  // 100 ms

  // Throws AudioSourceError when PortAudio cannot initialize.
  PortAudioSource();
  ~PortAudioSource() override;

  PortAudioSource(const PortAudioSource&) = delete;
  PortAudioSource& operator=(const PortAudioSource&) = delete;

  void Start(AudioChunkCallback on_chunk) override;
  void Stop() override;
  std::string Name() const override { return "portaudio"; }

 private:
  void CaptureLoop(AudioChunkCallback on_chunk);

  void* stream_ = nullptr;  // PaStream*
  std::thread capture_thread_;
  std::atomic<bool> capture_stop_{false};
};

}  // namespace seedling::audio

#endif  // SEEDLING_AUDIO_PORT_AUDIO_SOURCE_HPP_
