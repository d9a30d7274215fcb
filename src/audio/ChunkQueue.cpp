// Repository: Seedling
// Component: Audio Chunk Queue
// Purpose: Multi-producer / single-consumer hand-off from capture to sender.
// Copyright (c) 2025 RetroVue

#include "seedling/audio/ChunkQueue.hpp"

namespace seedling::audio {

bool ChunkQueue::Push(std::vector<uint8_t> chunk) {
  if (chunk.empty()) return true;
  std::lock_guard<std::mutex> lock(mutex_);
  if (stop_) return false;
  chunks_.push_back(std::move(chunk));
  return true;
}

bool ChunkQueue::Push(const uint8_t* data, size_t len) {
  if (data == nullptr || len == 0) return true;
  return Push(std::vector<uint8_t>(data, data + len));
}

void ChunkQueue::PushStop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_ = true;
}

size_t ChunkQueue::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_ = true;
  const size_t dropped = chunks_.size();
  chunks_.clear();
  return dropped;
}

ChunkQueue::PopResult ChunkQueue::TryPop(std::vector<uint8_t>* out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!chunks_.empty()) {
    *out = std::move(chunks_.front());
    chunks_.pop_front();
    return PopResult::kChunk;
  }
  return stop_ ? PopResult::kStop : PopResult::kEmpty;
}

bool ChunkQueue::stop_requested() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stop_;
}

size_t ChunkQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

}  // namespace seedling::audio
