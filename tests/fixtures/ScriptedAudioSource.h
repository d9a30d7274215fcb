#ifndef SEEDLING_TESTS_FIXTURES_SCRIPTED_AUDIO_SOURCE_H_
#define SEEDLING_TESTS_FIXTURES_SCRIPTED_AUDIO_SOURCE_H_

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "seedling/audio/IAudioSource.hpp"

namespace seedling::tests::fixtures
{

// Capture stand-in. The test thread plays the capture thread by calling
// Emit(); chunks emitted while stopped are discarded.
class ScriptedAudioSource : public audio::IAudioSource
{
public:
  void Start(audio::AudioChunkCallback on_chunk) override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++starts_;
    if (fail_start_) {
      throw audio::AudioSourceError("no input device");
    }
    on_chunk_ = std::move(on_chunk);
  }

  void Stop() override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stops_;
    on_chunk_ = nullptr;
  }

  std::string Name() const override { return "scripted"; }

  // Returns false when no capture is running.
  bool Emit(const std::vector<uint8_t>& chunk)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!on_chunk_) return false;
    on_chunk_(chunk.data(), chunk.size());
    return true;
  }

  void set_fail_start(bool fail)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_start_ = fail;
  }

  int starts() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return starts_;
  }

  int stops() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return stops_;
  }

  bool capturing() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(on_chunk_);
  }

private:
  mutable std::mutex mutex_;
  audio::AudioChunkCallback on_chunk_;
  bool fail_start_ = false;
  int starts_ = 0;
  int stops_ = 0;
};

// `bytes` of 16-bit PCM carrying a low-amplitude ramp.
inline std::vector<uint8_t> MakePcm(size_t bytes)
{
  std::vector<uint8_t> out(bytes);
  for (size_t i = 0; i + 1 < bytes; i += 2) {
    const int16_t sample = static_cast<int16_t>((i / 2) % 200 - 100);
    out[i] = static_cast<uint8_t>(static_cast<uint16_t>(sample) & 0xFF);
    out[i + 1] = static_cast<uint8_t>(static_cast<uint16_t>(sample) >> 8);
  }
  return out;
}

}  // namespace seedling::tests::fixtures

#endif  // SEEDLING_TESTS_FIXTURES_SCRIPTED_AUDIO_SOURCE_H_
