// Repository: Seedling
// Component: Main Loop
// Purpose: The daemon's serialized execution context. Recording state is only
//          touched from handlers running here.
// Copyright (c) 2025 RetroVue

#include "seedling/runtime/MainLoop.hpp"

#include <exception>
#include <string>

#include "seedling/util/Logger.hpp"

namespace seedling::runtime {

using util::Logger;

MainLoop::MainLoop() : work_(boost::asio::make_work_guard(ioc_)) {}

MainLoop::~MainLoop() {
  Shutdown();
}

void MainLoop::Run() {
  loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);
  running_.store(true, std::memory_order_release);
  for (;;) {
    try {
      ioc_.run();
      break;
    } catch (const std::exception& e) {
      Logger::Error(std::string("[MainLoop] Handler threw: ") + e.what());
    }
  }
  running_.store(false, std::memory_order_release);
  loop_thread_.store(std::thread::id(), std::memory_order_release);
}

void MainLoop::Shutdown() {
  work_.reset();
  ioc_.stop();
}

void MainLoop::Post(std::function<void()> fn) {
  boost::asio::post(ioc_, std::move(fn));
}

bool MainLoop::IsLoopThread() const {
  return loop_thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

}  // namespace seedling::runtime
