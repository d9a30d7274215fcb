// Repository: Seedling
// Component: Audio Segmenter Unit Tests
// Purpose: Fixed-size segmentation independent of input chunking.
// Copyright (c) 2025 RetroVue

#include "seedling/audio/AudioSegmenter.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

using seedling::audio::AudioSegmenter;

namespace {

std::vector<uint8_t> Ramp(size_t n)
{
  std::vector<uint8_t> out(n);
  for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(i % 251);
  return out;
}

// Feeds `input` in chunks of the given sizes (cycled) and returns all full
// segments concatenated, plus the final remainder.
std::pair<std::vector<std::vector<uint8_t>>, std::vector<uint8_t>> Segment(
    const std::vector<uint8_t>& input, const std::vector<size_t>& chunk_sizes)
{
  AudioSegmenter seg;
  std::vector<std::vector<uint8_t>> segments;
  size_t pos = 0;
  size_t k = 0;
  while (pos < input.size()) {
    const size_t n = std::min(chunk_sizes[k++ % chunk_sizes.size()], input.size() - pos);
    for (auto& s : seg.Push(input.data() + pos, n)) segments.push_back(std::move(s));
    pos += n;
  }
  return {segments, seg.DrainFinal()};
}

}  // namespace

TEST(AudioSegmenterTest, DefaultSegmentIs200msOf16kMono)
{
  AudioSegmenter seg;
  EXPECT_EQ(seg.SegmentBytes(), 6400u);
  EXPECT_EQ(AudioSegmenter(8000, 100).SegmentBytes(), 1600u);
}

TEST(AudioSegmenterTest, RejectsNonPositiveParameters)
{
  EXPECT_THROW(AudioSegmenter(0, 200), std::invalid_argument);
  EXPECT_THROW(AudioSegmenter(16000, 0), std::invalid_argument);
  EXPECT_THROW(AudioSegmenter(-1, -1), std::invalid_argument);
}

TEST(AudioSegmenterTest, ExactMultipleLeavesNoRemainder)
{
  auto [segments, rest] = Segment(Ramp(19200), {19200});
  EXPECT_EQ(segments.size(), 3u);
  EXPECT_TRUE(rest.empty());
}

TEST(AudioSegmenterTest, SmallChunksAccumulate)
{
  AudioSegmenter seg;
  const auto pcm = Ramp(3200);
  EXPECT_TRUE(seg.Push(pcm).empty());
  EXPECT_EQ(seg.Buffered(), 3200u);
  const auto out = seg.Push(pcm);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].size(), 6400u);
  EXPECT_EQ(seg.Buffered(), 0u);
}

TEST(AudioSegmenterTest, OutputIndependentOfChunking)
{
  const auto input = Ramp(6400 * 4 + 1234);
  const auto whole = Segment(input, {input.size()});
  const auto odd = Segment(input, {1, 333, 6399, 7001, 2});
  const auto tiny = Segment(input, {17});

  ASSERT_EQ(whole.first.size(), 4u);
  EXPECT_EQ(whole.second.size(), 1234u);
  EXPECT_EQ(odd.first, whole.first);
  EXPECT_EQ(odd.second, whole.second);
  EXPECT_EQ(tiny.first, whole.first);
  EXPECT_EQ(tiny.second, whole.second);

  // Segments preserve byte order.
  std::vector<uint8_t> joined;
  for (const auto& s : whole.first) joined.insert(joined.end(), s.begin(), s.end());
  joined.insert(joined.end(), whole.second.begin(), whole.second.end());
  EXPECT_EQ(joined, input);
}

TEST(AudioSegmenterTest, DrainFinalResetsBuffer)
{
  AudioSegmenter seg;
  seg.Push(Ramp(100));
  EXPECT_EQ(seg.DrainFinal().size(), 100u);
  EXPECT_EQ(seg.Buffered(), 0u);
  EXPECT_TRUE(seg.DrainFinal().empty());
}
