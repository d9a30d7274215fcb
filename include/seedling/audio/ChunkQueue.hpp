// Repository: Seedling
// Component: Audio Chunk Queue
// Purpose: Multi-producer / single-consumer hand-off from capture to sender.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_AUDIO_CHUNK_QUEUE_HPP_
#define SEEDLING_AUDIO_CHUNK_QUEUE_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace seedling::audio {

// Unbounded FIFO of PCM chunks terminated by a stop sentinel. Producers are the
// capture thread (Push) and the session owner (PushStop); the only consumer is
// the session sender, which polls with TryPop.
class ChunkQueue {
 public:
  enum class PopResult {
    kEmpty,  // nothing queued yet
    kChunk,  // *out holds the next chunk
    kStop,   // every chunk before the sentinel has been consumed
  };

  // Chunks pushed after the sentinel are dropped. Returns false when dropped.
  bool Push(std::vector<uint8_t> chunk);
  bool Push(const uint8_t* data, size_t len);

  // Idempotent.
  void PushStop();

  // Stop plus drop every chunk still pending. Used once the consumer is gone.
  // Returns the number of chunks dropped.
  size_t Close();

  PopResult TryPop(std::vector<uint8_t>* out);

  bool stop_requested() const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::deque<std::vector<uint8_t>> chunks_;
  bool stop_ = false;
};

}  // namespace seedling::audio

#endif  // SEEDLING_AUDIO_CHUNK_QUEUE_HPP_
