// Repository: Seedling
// Component: Main Loop Unit Tests
// Purpose: Serialized execution, futures and shutdown.
// Copyright (c) 2025 RetroVue

#include "seedling/runtime/MainLoop.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using seedling::runtime::MainLoop;

namespace {

class LoopThread
{
public:
  explicit LoopThread(MainLoop& loop) : loop_(loop), thread_([this] { loop_.Run(); }) {}
  ~LoopThread()
  {
    loop_.Shutdown();
    thread_.join();
  }

private:
  MainLoop& loop_;
  std::thread thread_;
};

}  // namespace

TEST(MainLoopTest, HandlersRunInPostingOrderOnLoopThread)
{
  MainLoop loop;
  LoopThread runner(loop);

  std::vector<int> order;
  std::atomic<bool> all_on_loop{true};
  for (int i = 0; i < 50; ++i) {
    loop.Post([&, i] {
      if (!loop.IsLoopThread()) all_on_loop = false;
      order.push_back(i);
    });
  }
  auto done = loop.Submit([&] { return order.size(); });
  ASSERT_EQ(done.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_EQ(done.get(), 50u);
  EXPECT_TRUE(all_on_loop);
  for (int i = 0; i < 50; ++i) EXPECT_EQ(order[i], i);
  EXPECT_FALSE(loop.IsLoopThread());
}

TEST(MainLoopTest, SubmitPropagatesExceptions)
{
  MainLoop loop;
  LoopThread runner(loop);
  auto f = loop.Submit([]() -> int { throw std::runtime_error("boom"); });
  ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(MainLoopTest, ThrowingHandlerDoesNotStopTheLoop)
{
  MainLoop loop;
  LoopThread runner(loop);
  loop.Post([] { throw std::runtime_error("handler failure"); });
  auto f = loop.Submit([] { return 7; });
  ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_EQ(f.get(), 7);
  EXPECT_TRUE(loop.running());
}

TEST(MainLoopTest, ShutdownEndsRun)
{
  MainLoop loop;
  std::thread t([&] { loop.Run(); });
  auto f = loop.Submit([] { return true; });
  ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  loop.Shutdown();
  t.join();
  EXPECT_FALSE(loop.running());
}
