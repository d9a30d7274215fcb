// Repository: Seedling
// Component: Control API
// Purpose: Maps control-plane routes onto recording actions and renders
//          their JSON replies. Transport-free so it can be driven directly.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_CONTROL_CONTROL_API_HPP_
#define SEEDLING_CONTROL_CONTROL_API_HPP_

#include <chrono>
#include <cstdint>
#include <string>

#include "seedling/runtime/IRecordingControl.hpp"

namespace seedling::control {

struct HttpReply {
  int status = 200;
  std::string body;  // always a JSON object
};

struct ControlApiConfig {
  uint16_t port = 0;  // reported by /health
  std::chrono::milliseconds start_wait{1000};
  std::chrono::milliseconds stop_wait{5000};
  std::chrono::milliseconds cancel_wait{2000};
};

// Routes (query strings are ignored):
//
//   /start   GET|POST  409 when already recording, else start
//   /stop    GET|POST  waits up to stop_wait for the transcript
//   /cancel  GET|POST  waits up to cancel_wait
//   /toggle  GET|POST  start when idle, otherwise stop; adds "action"
//   /status  GET       snapshot
//   /health  GET       liveness
//
// A wait that runs out yields an empty best-effort reply with "timeout":true;
// a handler never blocks longer than its bound.
class ControlApi {
 public:
  ControlApi(runtime::IRecordingControl& control, ControlApiConfig config);

  // Thread-safe; may block up to the route's wait bound.
  HttpReply Handle(const std::string& method, const std::string& target);

 private:
  HttpReply HandleStart();
  HttpReply HandleStop();
  HttpReply HandleCancel();
  HttpReply HandleToggle();
  HttpReply HandleStatus() const;
  HttpReply HandleHealth() const;

  runtime::IRecordingControl& control_;
  ControlApiConfig config_;
};

}  // namespace seedling::control

#endif  // SEEDLING_CONTROL_CONTROL_API_HPP_
