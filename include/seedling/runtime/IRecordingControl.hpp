// Repository: Seedling
// Component: Recording Control Interface
// Purpose: The thread-safe surface of the recording state machine.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_RUNTIME_I_RECORDING_CONTROL_HPP_
#define SEEDLING_RUNTIME_I_RECORDING_CONTROL_HPP_

#include <cstddef>
#include <cstdint>
#include <future>
#include <string>

namespace seedling::runtime {

enum class RecordingState {
  kIdle,       // no session
  kActive,     // capturing and streaming
  kFinishing,  // capture stopped, waiting on the session to wind down
};

enum class ActionKind { kStart, kStop, kCancel, kToggle };

enum class ActionStatus {
  kStarted,
  kAlreadyRecording,
  kStopped,
  kCancelled,
  kNotRecording,
  kFailed,
};

const char* RecordingStateName(RecordingState state);
const char* ActionKindName(ActionKind kind);
const char* ActionStatusName(ActionStatus status);

struct ActionOutcome {
  // The action actually performed. A toggle reports kStart or kStop.
  ActionKind action = ActionKind::kStart;
  ActionStatus status = ActionStatus::kNotRecording;
  std::string text;
  double duration_s = 0.0;
  size_t chars = 0;  // Unicode code points in `text`
  std::string message;
};

// Read-only view published after every transition; safe from any thread.
struct RecordingSnapshot {
  RecordingState state = RecordingState::kIdle;
  std::string text;            // running transcript of the active recording
  double elapsed_s = 0.0;      // since start, when not idle
  std::string last_text;       // last completed transcript
  double last_duration_s = 0.0;
  bool stream_alive = false;   // the active session has not closed yet
  uint64_t recordings = 0;     // recordings started since launch
};

// Callable from any thread.
class IRecordingControl {
 public:
  virtual ~IRecordingControl() = default;

  // Queues `kind` on the main loop. The future becomes ready once the action
  // has fully run (for stop, after the session has wound down).
  virtual std::future<ActionOutcome> Dispatch(ActionKind kind) = 0;

  virtual RecordingSnapshot Snapshot() const = 0;
};

}  // namespace seedling::runtime

#endif  // SEEDLING_RUNTIME_I_RECORDING_CONTROL_HPP_
