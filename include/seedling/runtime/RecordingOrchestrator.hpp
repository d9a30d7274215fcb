// Repository: Seedling
// Component: Recording Orchestrator
// Purpose: Single authoritative recording state machine. Owns the streaming
//          session of the active recording and the last completed result.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_RUNTIME_RECORDING_ORCHESTRATOR_HPP_
#define SEEDLING_RUNTIME_RECORDING_ORCHESTRATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "seedling/audio/IAudioSource.hpp"
#include "seedling/runtime/IPresentationSink.hpp"
#include "seedling/runtime/IRecordingControl.hpp"
#include "seedling/runtime/MainLoop.hpp"
#include "seedling/session/IFrameChannel.hpp"
#include "seedling/session/StreamingSession.hpp"
#include "time/ITimeSource.hpp"

namespace seedling::runtime {

// RecordingOrchestrator
//
// Start/Stop/Cancel/Toggle must run on the main loop; that is the only place
// recording state changes and no lock guards it. Other threads use Dispatch(),
// which posts the action and hands back a future, and Snapshot().
//
// Transitions:
//   Idle --start--> Active --stop--> Finishing --(graceful finish)--> Idle
//                   Active --cancel--> Finishing --(forced stop)--> Idle
//
// A second start while Active is a conflict, never a pre-emption. Stop and
// cancel while Idle are no-ops that report the last completed result.
//
// Text from the streaming session arrives on its worker and is posted here
// tagged with the recording number; text from an earlier recording is
// dropped. The transcript returned by Stop() is read from the session after
// it has wound down, so a revision that arrived during the finish wait is not
// lost.
class RecordingOrchestrator : public IRecordingControl {
 public:
  RecordingOrchestrator(MainLoop& loop,
                        session::StreamingSessionConfig session_config,
                        session::FrameChannelFactory channel_factory,
                        std::shared_ptr<audio::IAudioSource> audio_source,
                        std::shared_ptr<IPresentationSink> presentation,
                        std::shared_ptr<ITimeSource> clock);
  ~RecordingOrchestrator() override;

  RecordingOrchestrator(const RecordingOrchestrator&) = delete;
  RecordingOrchestrator& operator=(const RecordingOrchestrator&) = delete;

  // Main loop only.
  ActionOutcome Start();
  ActionOutcome Stop();
  ActionOutcome Cancel();
  ActionOutcome Toggle();
  ActionOutcome Execute(ActionKind kind);

  // Cancels an active recording. Main loop only; used at daemon exit.
  void Shutdown();

  // Any thread.
  std::future<ActionOutcome> Dispatch(ActionKind kind) override;
  RecordingSnapshot Snapshot() const override;

  // Main loop only. The session of the active recording, if any.
  std::shared_ptr<session::StreamingSession> active_session() const { return session_; }

 private:
  // Guards callbacks that outlive the orchestrator (abandoned session workers,
  // the capture thread) against touching a destroyed instance.
  struct CallbackGate {
    std::mutex mutex;
    RecordingOrchestrator* owner = nullptr;
  };

  void OnSessionText(uint64_t recording_id, const std::string& text);
  void OnSessionClosed(uint64_t recording_id, session::StreamingSession::CloseReason reason);
  void OnCapturedAudio(uint64_t recording_id, std::vector<int16_t> samples);

  double ElapsedSeconds() const;
  void Publish();

  MainLoop& loop_;
  session::StreamingSessionConfig session_config_;
  session::FrameChannelFactory channel_factory_;
  std::shared_ptr<audio::IAudioSource> audio_source_;
  std::shared_ptr<IPresentationSink> presentation_;
  std::shared_ptr<ITimeSource> clock_;
  std::shared_ptr<CallbackGate> gate_;

  // Main loop state.
  RecordingState state_ = RecordingState::kIdle;
  std::shared_ptr<session::StreamingSession> session_;
  uint64_t recording_id_ = 0;
  int64_t start_ms_ = 0;
  std::string transcript_;
  std::string last_text_;
  double last_duration_s_ = 0.0;

  // Published copy for Snapshot().
  mutable std::mutex snapshot_mutex_;
  RecordingSnapshot published_;
  int64_t published_start_ms_ = 0;
  std::shared_ptr<session::StreamingSession> published_session_;
};

}  // namespace seedling::runtime

#endif  // SEEDLING_RUNTIME_RECORDING_ORCHESTRATOR_HPP_
