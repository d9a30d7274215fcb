// Repository: Seedling
// Component: Audio Segmenter
// Purpose: Slices a raw PCM byte stream into fixed-duration segments.
// Copyright (c) 2025 RetroVue

#include "seedling/audio/AudioSegmenter.hpp"

#include <stdexcept>
#include <string>

namespace seedling::audio {

AudioSegmenter::AudioSegmenter(int sample_rate_hz, int segment_duration_ms) {
  if (sample_rate_hz <= 0 || segment_duration_ms <= 0) {
    throw std::invalid_argument(
        "AudioSegmenter: sample rate and segment duration must be positive (got " +
        std::to_string(sample_rate_hz) + " Hz, " +
        std::to_string(segment_duration_ms) + " ms)");
  }
  const int64_t bytes = static_cast<int64_t>(sample_rate_hz) * kBytesPerSample *
                        segment_duration_ms / 1000;
  if (bytes <= 0) {
    throw std::invalid_argument("AudioSegmenter: segment shorter than one byte");
  }
  segment_bytes_ = static_cast<size_t>(bytes);
  buffer_.reserve(segment_bytes_ * 2);
}

std::vector<std::vector<uint8_t>> AudioSegmenter::Push(const uint8_t* data, size_t len) {
  std::vector<std::vector<uint8_t>> segments;
  if (data == nullptr || len == 0) return segments;

  buffer_.insert(buffer_.end(), data, data + len);
  size_t offset = 0;
  while (buffer_.size() - offset >= segment_bytes_) {
    segments.emplace_back(buffer_.begin() + static_cast<std::ptrdiff_t>(offset),
                          buffer_.begin() + static_cast<std::ptrdiff_t>(offset + segment_bytes_));
    offset += segment_bytes_;
  }
  if (offset > 0) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
  }
  return segments;
}

std::vector<std::vector<uint8_t>> AudioSegmenter::Push(const std::vector<uint8_t>& chunk) {
  return Push(chunk.data(), chunk.size());
}

std::vector<uint8_t> AudioSegmenter::DrainFinal() {
  std::vector<uint8_t> rest;
  rest.swap(buffer_);
  return rest;
}

}  // namespace seedling::audio
