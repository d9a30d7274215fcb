// Repository: Seedling
// Component: Audio Chunk Queue Unit Tests
// Purpose: Ordering, stop sentinel and multi-producer hand-off.
// Copyright (c) 2025 RetroVue

#include "seedling/audio/ChunkQueue.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <thread>
#include <vector>

using seedling::audio::ChunkQueue;
using PopResult = seedling::audio::ChunkQueue::PopResult;

TEST(ChunkQueueTest, EmptyQueueReportsEmpty)
{
  ChunkQueue q;
  std::vector<uint8_t> out;
  EXPECT_EQ(q.TryPop(&out), PopResult::kEmpty);
  EXPECT_FALSE(q.stop_requested());
}

TEST(ChunkQueueTest, CloseDropsPendingChunksAndRejectsNewOnes)
{
  ChunkQueue q;
  q.Push(std::vector<uint8_t>{1});
  q.Push(std::vector<uint8_t>{2});

  EXPECT_EQ(q.Close(), 2u);
  EXPECT_EQ(q.size(), 0u);
  EXPECT_FALSE(q.Push(std::vector<uint8_t>{3}));
  std::vector<uint8_t> out;
  EXPECT_EQ(q.TryPop(&out), PopResult::kStop);
}

TEST(ChunkQueueTest, ChunksBeforeStopAreDeliveredFirst)
{
  ChunkQueue q;
  q.Push(std::vector<uint8_t>{1, 2});
  q.Push(std::vector<uint8_t>{3});
  q.PushStop();

  std::vector<uint8_t> out;
  ASSERT_EQ(q.TryPop(&out), PopResult::kChunk);
  EXPECT_EQ(out, (std::vector<uint8_t>{1, 2}));
  ASSERT_EQ(q.TryPop(&out), PopResult::kChunk);
  EXPECT_EQ(out, (std::vector<uint8_t>{3}));
  EXPECT_EQ(q.TryPop(&out), PopResult::kStop);
  EXPECT_EQ(q.TryPop(&out), PopResult::kStop);
}

TEST(ChunkQueueTest, PushAfterStopIsDropped)
{
  ChunkQueue q;
  q.PushStop();
  q.PushStop();
  const uint8_t data[] = {9, 9};
  EXPECT_FALSE(q.Push(data, sizeof(data)));
  EXPECT_EQ(q.size(), 0u);
  EXPECT_TRUE(q.stop_requested());
}

TEST(ChunkQueueTest, EmptyChunksAreIgnored)
{
  ChunkQueue q;
  EXPECT_TRUE(q.Push(nullptr, 0));
  EXPECT_TRUE(q.Push(std::vector<uint8_t>{}));
  EXPECT_EQ(q.size(), 0u);
}

TEST(ChunkQueueTest, ConcurrentProducersLoseNothing)
{
  ChunkQueue q;
  constexpr int kProducers = 4;
  constexpr int kChunksEach = 500;
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&q, p] {
      for (int i = 0; i < kChunksEach; ++i) {
        q.Push(std::vector<uint8_t>{static_cast<uint8_t>(p), static_cast<uint8_t>(i & 0xFF)});
      }
    });
  }

  size_t bytes = 0;
  std::vector<int> counts(kProducers, 0);
  std::vector<uint8_t> out;
  bool stopped = false;
  std::thread stopper([&] {
    for (auto& t : producers) t.join();
    q.PushStop();
  });
  while (!stopped) {
    switch (q.TryPop(&out)) {
      case PopResult::kChunk:
        bytes += out.size();
        ++counts[out[0]];
        break;
      case PopResult::kStop:
        stopped = true;
        break;
      case PopResult::kEmpty:
        std::this_thread::yield();
        break;
    }
  }
  stopper.join();

  EXPECT_EQ(bytes, static_cast<size_t>(kProducers * kChunksEach * 2));
  for (int p = 0; p < kProducers; ++p) EXPECT_EQ(counts[p], kChunksEach);
}
