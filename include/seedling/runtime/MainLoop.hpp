// Repository: Seedling
// Component: Main Loop
// Purpose: The daemon's serialized execution context. Recording state is only
//          touched from handlers running here.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_RUNTIME_MAIN_LOOP_HPP_
#define SEEDLING_RUNTIME_MAIN_LOOP_HPP_

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace seedling::runtime {

// MainLoop wraps a single-threaded io_context kept alive by a work guard.
// Run() blocks the calling thread (the daemon's main thread) until Shutdown().
// Post()/Submit() are safe from any thread; handlers run one at a time in
// posting order.
class MainLoop {
 public:
  MainLoop();
  ~MainLoop();

  MainLoop(const MainLoop&) = delete;
  MainLoop& operator=(const MainLoop&) = delete;

  // Runs handlers until Shutdown(). An exception escaping a handler is
  // logged and the loop keeps running.
  void Run();

  // Thread-safe; idempotent. Pending handlers are discarded.
  void Shutdown();

  void Post(std::function<void()> fn);

  // Posts `fn` and returns a future for its result (or exception).
  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> future = task->get_future();
    boost::asio::post(ioc_, [task] { (*task)(); });
    return future;
  }

  // True when called from inside Run().
  bool IsLoopThread() const;

  bool running() const { return running_.load(std::memory_order_acquire); }

  boost::asio::io_context& context() { return ioc_; }

 private:
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::atomic<bool> running_{false};
  std::atomic<std::thread::id> loop_thread_{};
};

}  // namespace seedling::runtime

#endif  // SEEDLING_RUNTIME_MAIN_LOOP_HPP_
