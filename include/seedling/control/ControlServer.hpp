// Repository: Seedling
// Component: Control Server
// Purpose: Loopback HTTP/1.1 listener that feeds requests to the ControlApi.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_CONTROL_CONTROL_SERVER_HPP_
#define SEEDLING_CONTROL_CONTROL_SERVER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "seedling/control/ControlApi.hpp"

namespace seedling::control {

class Listener;

struct ControlServerConfig {
  std::string bind_address = "127.0.0.1";
  uint16_t port = 0;  // 0 picks an ephemeral port
  int io_threads = 2;
  // Handlers may block for a stop's full wait; they run here rather than on
  // the I/O threads.
  int handler_threads = 4;
};

// ControlServer owns its io_context and thread pools. Requests are read and
// written on the I/O threads (one strand per connection); ControlApi::Handle
// runs on the handler pool and its reply is posted back to the connection.
class ControlServer {
 public:
  ControlServer(ControlApi& api, ControlServerConfig config);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Binds, listens and spawns the I/O threads. Throws std::runtime_error when
  // the address cannot be bound.
  void Start();

  // Closes the listener and joins all threads. Idempotent.
  void Stop();

  // Bound port; valid after Start().
  uint16_t port() const { return bound_port_; }

 private:
  ControlApi& api_;
  ControlServerConfig config_;

  boost::asio::io_context ioc_;
  std::unique_ptr<boost::asio::thread_pool> handlers_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> io_threads_;
  uint16_t bound_port_ = 0;
  std::atomic<bool> running_{false};
};

}  // namespace seedling::control

#endif  // SEEDLING_CONTROL_CONTROL_SERVER_HPP_
