// Repository: Seedling
// Component: Control API
// Purpose: Maps control-plane routes onto recording actions and renders
//          their JSON replies. Transport-free so it can be driven directly.
// Copyright (c) 2025 RetroVue

#include "seedling/control/ControlApi.hpp"

#include <exception>
#include <future>
#include <optional>
#include <utility>

#include "seedling/util/Json.hpp"
#include "seedling/util/Logger.hpp"

namespace seedling::control {

using runtime::ActionKind;
using runtime::ActionOutcome;
using runtime::ActionStatus;
using runtime::RecordingState;
using util::JsonObjectWriter;
using util::Logger;

namespace {

constexpr int kDurationDecimals = 2;

HttpReply Reply(int status, const JsonObjectWriter& body) {
  HttpReply r;
  r.status = status;
  r.body = body.str();
  return r;
}

std::optional<ActionOutcome> Await(std::future<ActionOutcome> future,
                                   std::chrono::milliseconds bound) {
  if (future.wait_for(bound) != std::future_status::ready) {
    return std::nullopt;
  }
  try {
    return future.get();
  } catch (const std::exception& e) {
    Logger::Error(std::string("[ControlApi] Action failed: ") + e.what());
    ActionOutcome failed;
    failed.status = ActionStatus::kFailed;
    failed.message = e.what();
    return failed;
  }
}

// Body for a completed start outcome.
HttpReply StartReply(const ActionOutcome& o, JsonObjectWriter w) {
  switch (o.status) {
    case ActionStatus::kStarted:
      w.AddString("status", "started").AddString("message", o.message);
      return Reply(200, w);
    case ActionStatus::kAlreadyRecording:
      w.AddString("status", "already_recording").AddString("message", o.message);
      return Reply(409, w);
    default:
      w.AddString("status", "error").AddString("message", o.message);
      return Reply(500, w);
  }
}

HttpReply StopReply(const ActionOutcome& o, JsonObjectWriter w) {
  if (o.status == ActionStatus::kNotRecording) {
    w.AddString("status", "not_recording")
        .AddString("text", o.text)
        .AddFixed("duration", o.duration_s, kDurationDecimals)
        .AddString("message", o.message);
    return Reply(200, w);
  }
  if (o.status == ActionStatus::kFailed) {
    w.AddString("status", "error").AddString("message", o.message);
    return Reply(500, w);
  }
  w.AddString("status", "stopped")
      .AddString("text", o.text)
      .AddFixed("duration", o.duration_s, kDurationDecimals)
      .AddInt("chars", static_cast<int64_t>(o.chars));
  return Reply(200, w);
}

HttpReply StopTimeoutReply(JsonObjectWriter w) {
  w.AddString("status", "stopped")
      .AddString("text", "")
      .AddFixed("duration", 0.0, kDurationDecimals)
      .AddInt("chars", 0)
      .AddBool("timeout", true);
  return Reply(200, w);
}

bool IsActionMethod(const std::string& method) {
  return method == "GET" || method == "POST";
}

}  // namespace

ControlApi::ControlApi(runtime::IRecordingControl& control, ControlApiConfig config)
    : control_(control), config_(config) {}

HttpReply ControlApi::Handle(const std::string& method, const std::string& target) {
  const std::string path = target.substr(0, target.find('?'));

  HttpReply reply;
  const bool read_only = path == "/status" || path == "/health";
  const bool action = path == "/start" || path == "/stop" || path == "/cancel" || path == "/toggle";
  if (!read_only && !action) {
    JsonObjectWriter w;
    w.AddString("status", "not_found").AddString("message", "Unknown endpoint " + path);
    reply = Reply(404, w);
  } else if ((read_only && method != "GET") || (action && !IsActionMethod(method))) {
    JsonObjectWriter w;
    w.AddString("status", "method_not_allowed")
        .AddString("message", method + " is not supported on " + path);
    reply = Reply(405, w);
  } else if (path == "/start") {
    reply = HandleStart();
  } else if (path == "/stop") {
    reply = HandleStop();
  } else if (path == "/cancel") {
    reply = HandleCancel();
  } else if (path == "/toggle") {
    reply = HandleToggle();
  } else if (path == "/status") {
    reply = HandleStatus();
  } else {
    reply = HandleHealth();
  }

  if (action) {
    Logger::Info("[ControlApi] " + method + " " + path + " -> " + std::to_string(reply.status));
  } else {
    Logger::Debug("[ControlApi] " + method + " " + path + " -> " + std::to_string(reply.status));
  }
  return reply;
}

HttpReply ControlApi::HandleStart() {
  if (control_.Snapshot().state != RecordingState::kIdle) {
    JsonObjectWriter w;
    w.AddString("status", "already_recording")
        .AddString("message", "Recording is already in progress");
    return Reply(409, w);
  }
  auto outcome = Await(control_.Dispatch(ActionKind::kStart), config_.start_wait);
  if (!outcome) {
    JsonObjectWriter w;
    w.AddString("status", "pending").AddString("message", "Start requested");
    return Reply(202, w);
  }
  return StartReply(*outcome, JsonObjectWriter());
}

HttpReply ControlApi::HandleStop() {
  auto outcome = Await(control_.Dispatch(ActionKind::kStop), config_.stop_wait);
  if (!outcome) {
    Logger::Warn("[ControlApi] Stop did not complete within " +
                 std::to_string(config_.stop_wait.count()) + "ms");
    return StopTimeoutReply(JsonObjectWriter());
  }
  return StopReply(*outcome, JsonObjectWriter());
}

HttpReply ControlApi::HandleCancel() {
  auto outcome = Await(control_.Dispatch(ActionKind::kCancel), config_.cancel_wait);
  JsonObjectWriter w;
  if (!outcome) {
    Logger::Warn("[ControlApi] Cancel did not complete within " +
                 std::to_string(config_.cancel_wait.count()) + "ms");
    w.AddString("status", "cancelled")
        .AddFixed("duration", 0.0, kDurationDecimals)
        .AddString("message", "Cancel requested")
        .AddBool("timeout", true);
    return Reply(200, w);
  }
  if (outcome->status == ActionStatus::kNotRecording) {
    w.AddString("status", "not_recording").AddString("message", outcome->message);
    return Reply(200, w);
  }
  if (outcome->status == ActionStatus::kFailed) {
    w.AddString("status", "error").AddString("message", outcome->message);
    return Reply(500, w);
  }
  w.AddString("status", "cancelled")
      .AddFixed("duration", outcome->duration_s, kDurationDecimals)
      .AddString("message", outcome->message);
  return Reply(200, w);
}

HttpReply ControlApi::HandleToggle() {
  const bool was_idle = control_.Snapshot().state == RecordingState::kIdle;
  // The stop branch may need the full stop bound.
  auto outcome = Await(control_.Dispatch(ActionKind::kToggle),
                       was_idle ? config_.start_wait : config_.stop_wait);
  if (!outcome) {
    JsonObjectWriter w;
    w.AddString("action", was_idle ? "start" : "stop");
    if (was_idle) {
      w.AddString("status", "pending").AddString("message", "Start requested");
      return Reply(202, w);
    }
    return StopTimeoutReply(std::move(w));
  }

  JsonObjectWriter w;
  if (outcome->action == ActionKind::kStart) {
    w.AddString("action", "start");
    return StartReply(*outcome, std::move(w));
  }
  w.AddString("action", "stop");
  return StopReply(*outcome, std::move(w));
}

HttpReply ControlApi::HandleStatus() const {
  const runtime::RecordingSnapshot snap = control_.Snapshot();
  const bool recording = snap.state != RecordingState::kIdle;
  JsonObjectWriter w;
  w.AddString("state", runtime::RecordingStateName(snap.state))
      .AddBool("recording", recording)
      .AddString("text", snap.text);
  if (recording) {
    w.AddFixed("duration", snap.elapsed_s, kDurationDecimals)
        .AddBool("stream_alive", snap.stream_alive);
  } else {
    w.AddString("last_text", snap.last_text)
        .AddFixed("last_duration", snap.last_duration_s, kDurationDecimals);
  }
  return Reply(200, w);
}

HttpReply ControlApi::HandleHealth() const {
  JsonObjectWriter w;
  w.AddString("status", "ok")
      .AddInt("port", config_.port)
      .AddBool("recording", control_.Snapshot().state != RecordingState::kIdle);
  return Reply(200, w);
}

}  // namespace seedling::control
