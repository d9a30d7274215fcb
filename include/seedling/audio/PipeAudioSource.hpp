// Repository: Seedling
// Component: Pipe Audio Source
// Purpose: Reads raw s16le mono PCM from stdin, a FIFO or any readable fd.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_AUDIO_PIPE_AUDIO_SOURCE_HPP_
#define SEEDLING_AUDIO_PIPE_AUDIO_SOURCE_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "seedling/audio/IAudioSource.hpp"

namespace seedling::audio {

// PipeAudioSource drains its descriptor continuously on a reader thread so the
// upstream producer (e.g. `arecord -t raw -f S16_LE -r 16000 -c 1`) never
// blocks. Bytes read while no recording is active are discarded.
//
// End of input is sticky: once the writer goes away, Start() throws.
class PipeAudioSource : public IAudioSource {
 public:
  static constexpr size_t kDefaultReadBytes = 3200;  // 100 ms at 16 kHz

  // Takes ownership of `fd` when owns_fd is true.
  PipeAudioSource(int fd, bool owns_fd, size_t read_bytes = kDefaultReadBytes);
  ~PipeAudioSource() override;

  PipeAudioSource(const PipeAudioSource&) = delete;
  PipeAudioSource& operator=(const PipeAudioSource&) = delete;

  // "-" or "stdin" selects fd 0; anything else is opened read-only.
  // Throws AudioSourceError when the path cannot be opened.
  static std::unique_ptr<PipeAudioSource> Open(const std::string& path);

  void Start(AudioChunkCallback on_chunk) override;
  void Stop() override;
  std::string Name() const override { return "pipe"; }

  bool at_eof() const { return eof_.load(std::memory_order_acquire); }

 private:
  void ReaderLoop();

  int fd_;
  bool owns_fd_;
  size_t read_bytes_;

  std::thread reader_thread_;
  std::atomic<bool> reader_stop_{false};
  std::atomic<bool> eof_{false};

  std::mutex callback_mutex_;
  AudioChunkCallback on_chunk_;
};

}  // namespace seedling::audio

#endif  // SEEDLING_AUDIO_PIPE_AUDIO_SOURCE_HPP_
