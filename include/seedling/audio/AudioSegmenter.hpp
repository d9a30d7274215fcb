// Repository: Seedling
// Component: Audio Segmenter
// Purpose: Slices a raw PCM byte stream into fixed-duration segments.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_AUDIO_AUDIO_SEGMENTER_HPP_
#define SEEDLING_AUDIO_AUDIO_SEGMENTER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace seedling::audio {

// AudioSegmenter accumulates arbitrary-sized PCM chunks and hands back
// segments of exactly SegmentBytes() bytes. The output does not depend on how
// the input was chunked: k * SegmentBytes() + r bytes in total always yields k
// segments from Push() and r bytes from DrainFinal().
//
// Not thread-safe; owned by the session sender.
class AudioSegmenter {
 public:
  // 16 kHz, 16-bit mono, 200 ms segments => 6400 bytes.
  static constexpr int kDefaultSampleRateHz = 16000;
  static constexpr int kDefaultSegmentMs = 200;
  static constexpr int kBytesPerSample = 2;

  // Throws std::invalid_argument when either value is not positive.
  explicit AudioSegmenter(int sample_rate_hz = kDefaultSampleRateHz,
                          int segment_duration_ms = kDefaultSegmentMs);

  std::vector<std::vector<uint8_t>> Push(const uint8_t* data, size_t len);
  std::vector<std::vector<uint8_t>> Push(const std::vector<uint8_t>& chunk);

  // Returns the partial segment (possibly empty) and resets the buffer.
  std::vector<uint8_t> DrainFinal();

  size_t Buffered() const { return buffer_.size(); }
  size_t SegmentBytes() const { return segment_bytes_; }

 private:
  size_t segment_bytes_;
  std::vector<uint8_t> buffer_;
};

}  // namespace seedling::audio

#endif  // SEEDLING_AUDIO_AUDIO_SEGMENTER_HPP_
