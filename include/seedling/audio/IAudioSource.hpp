// Repository: Seedling
// Component: Audio Source Interface
// Purpose: Capture collaborator that pushes mono 16-bit PCM at 16 kHz.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_AUDIO_I_AUDIO_SOURCE_HPP_
#define SEEDLING_AUDIO_I_AUDIO_SOURCE_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace seedling::audio {

// Invoked from the source's capture thread with little-endian s16 mono PCM.
using AudioChunkCallback = std::function<void(const uint8_t* data, size_t len)>;

class AudioSourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class IAudioSource {
 public:
  virtual ~IAudioSource() = default;

  // Begins delivering chunks to `on_chunk` until Stop(). Throws
  // AudioSourceError when capture cannot begin.
  virtual void Start(AudioChunkCallback on_chunk) = 0;

  // Stops delivery. After Stop() returns the callback is not invoked again.
  // Safe to call when not started.
  virtual void Stop() = 0;

  virtual std::string Name() const = 0;
};

}  // namespace seedling::audio

#endif  // SEEDLING_AUDIO_I_AUDIO_SOURCE_HPP_
