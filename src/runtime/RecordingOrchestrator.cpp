// Repository: Seedling
// Component: Recording Orchestrator
// Purpose: Single authoritative recording state machine. Owns the streaming
//          session of the active recording and the last completed result.
// Copyright (c) 2025 RetroVue

#include "seedling/runtime/RecordingOrchestrator.hpp"

#include <cstdio>
#include <exception>
#include <utility>

#include "seedling/util/Logger.hpp"
#include "seedling/util/Text.hpp"

namespace seedling::runtime {

using session::StreamingSession;
using util::Logger;

namespace {

constexpr const char* kMsgStarted = "Recording started";
constexpr const char* kMsgAlreadyRecording = "Recording is already in progress";
constexpr const char* kMsgNotRecording = "No recording in progress";
constexpr const char* kMsgCancelled = "Recording cancelled";

std::string Seconds(double s) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.2fs", s);
  return buf;
}

}  // namespace

const char* RecordingStateName(RecordingState state) {
  switch (state) {
    case RecordingState::kIdle: return "idle";
    case RecordingState::kActive: return "active";
    case RecordingState::kFinishing: return "finishing";
  }
  return "unknown";
}

const char* ActionKindName(ActionKind kind) {
  switch (kind) {
    case ActionKind::kStart: return "start";
    case ActionKind::kStop: return "stop";
    case ActionKind::kCancel: return "cancel";
    case ActionKind::kToggle: return "toggle";
  }
  return "unknown";
}

const char* ActionStatusName(ActionStatus status) {
  switch (status) {
    case ActionStatus::kStarted: return "started";
    case ActionStatus::kAlreadyRecording: return "already_recording";
    case ActionStatus::kStopped: return "stopped";
    case ActionStatus::kCancelled: return "cancelled";
    case ActionStatus::kNotRecording: return "not_recording";
    case ActionStatus::kFailed: return "error";
  }
  return "unknown";
}

RecordingOrchestrator::RecordingOrchestrator(MainLoop& loop,
                                             session::StreamingSessionConfig session_config,
                                             session::FrameChannelFactory channel_factory,
                                             std::shared_ptr<audio::IAudioSource> audio_source,
                                             std::shared_ptr<IPresentationSink> presentation,
                                             std::shared_ptr<ITimeSource> clock)
    : loop_(loop),
      session_config_(std::move(session_config)),
      channel_factory_(std::move(channel_factory)),
      audio_source_(std::move(audio_source)),
      presentation_(std::move(presentation)),
      clock_(std::move(clock)),
      gate_(std::make_shared<CallbackGate>()) {
  gate_->owner = this;
}

RecordingOrchestrator::~RecordingOrchestrator() {
  {
    std::lock_guard<std::mutex> lock(gate_->mutex);
    gate_->owner = nullptr;
  }
  if (session_) {
    // The loop is gone by now; end the recording without reporting it.
    audio_source_->Stop();
    session_->Stop();
    session_.reset();
  }
}

// ======================================================================
// Actions (main loop)
// ======================================================================

ActionOutcome RecordingOrchestrator::Execute(ActionKind kind) {
  switch (kind) {
    case ActionKind::kStart: return Start();
    case ActionKind::kStop: return Stop();
    case ActionKind::kCancel: return Cancel();
    case ActionKind::kToggle: return Toggle();
  }
  ActionOutcome outcome;
  outcome.action = kind;
  outcome.status = ActionStatus::kFailed;
  outcome.message = "unknown action";
  return outcome;
}

ActionOutcome RecordingOrchestrator::Start() {
  ActionOutcome outcome;
  outcome.action = ActionKind::kStart;
  if (state_ != RecordingState::kIdle) {
    outcome.status = ActionStatus::kAlreadyRecording;
    outcome.message = kMsgAlreadyRecording;
    Logger::Info("[RecordingOrchestrator] Start ignored: recording already in progress");
    return outcome;
  }

  const uint64_t id = ++recording_id_;
  start_ms_ = clock_->NowMs();
  transcript_.clear();

  std::weak_ptr<CallbackGate> gate = gate_;
  auto on_text = [gate, id](const std::string& text) {
    auto g = gate.lock();
    if (!g) return;
    std::lock_guard<std::mutex> lock(g->mutex);
    if (g->owner == nullptr) return;
    g->owner->loop_.Post([gate, id, text] {
      auto g2 = gate.lock();
      if (g2 && g2->owner != nullptr) g2->owner->OnSessionText(id, text);
    });
  };
  auto on_closed = [gate, id](StreamingSession::CloseReason reason) {
    auto g = gate.lock();
    if (!g) return;
    std::lock_guard<std::mutex> lock(g->mutex);
    if (g->owner == nullptr) return;
    g->owner->loop_.Post([gate, id, reason] {
      auto g2 = gate.lock();
      if (g2 && g2->owner != nullptr) g2->owner->OnSessionClosed(id, reason);
    });
  };

  auto session = StreamingSession::Create(session_config_, channel_factory_,
                                          std::move(on_text), std::move(on_closed));
  session_ = session;
  state_ = RecordingState::kActive;
  session->Start();

  const bool want_samples = presentation_ != nullptr;
  try {
    audio_source_->Start([session, gate, id, want_samples](const uint8_t* data, size_t len) {
      session->FeedAudio(data, len);
      if (!want_samples || len < 2) return;
      std::vector<int16_t> samples(len / 2);
      for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(static_cast<uint16_t>(data[2 * i]) |
                                          (static_cast<uint16_t>(data[2 * i + 1]) << 8));
      }
      auto g = gate.lock();
      if (!g) return;
      std::lock_guard<std::mutex> lock(g->mutex);
      if (g->owner == nullptr) return;
      g->owner->loop_.Post([gate, id, samples = std::move(samples)]() mutable {
        auto g2 = gate.lock();
        if (g2 && g2->owner != nullptr) g2->owner->OnCapturedAudio(id, std::move(samples));
      });
    });
  } catch (const audio::AudioSourceError& e) {
    Logger::Error(std::string("[RecordingOrchestrator] Audio capture failed to start: ") + e.what());
    session->Stop();
    session_.reset();
    state_ = RecordingState::kIdle;
    Publish();
    outcome.status = ActionStatus::kFailed;
    outcome.message = std::string("Audio capture failed: ") + e.what();
    return outcome;
  }

  Publish();
  if (presentation_) {
    presentation_->OnRecordingStarted();
  }
  Logger::Info("[RecordingOrchestrator] Recording #" + std::to_string(id) + " started (audio=" +
               audio_source_->Name() + ")");
  outcome.status = ActionStatus::kStarted;
  outcome.message = kMsgStarted;
  return outcome;
}

ActionOutcome RecordingOrchestrator::Stop() {
  ActionOutcome outcome;
  outcome.action = ActionKind::kStop;
  if (state_ != RecordingState::kActive) {
    outcome.status = ActionStatus::kNotRecording;
    outcome.text = last_text_;
    outcome.duration_s = last_duration_s_;
    outcome.chars = util::Utf8CodePointCount(last_text_);
    outcome.message = kMsgNotRecording;
    return outcome;
  }

  const double duration = ElapsedSeconds();
  state_ = RecordingState::kFinishing;
  Publish();
  audio_source_->Stop();

  auto session = std::move(session_);
  const bool clean = session->Finish();
  std::string text = session->LatestText();
  if (text.empty()) {
    text = transcript_;
  }
  text = util::StripTrailingPunctuation(text);

  last_text_ = text;
  last_duration_s_ = duration;
  transcript_.clear();
  state_ = RecordingState::kIdle;
  Publish();

  if (presentation_) {
    presentation_->OnRecordingEnded(text, false);
  }
  outcome.status = ActionStatus::kStopped;
  outcome.text = text;
  outcome.duration_s = duration;
  outcome.chars = util::Utf8CodePointCount(text);
  Logger::Info("[RecordingOrchestrator] Recording #" + std::to_string(recording_id_) +
               " stopped (duration=" + Seconds(duration) + ", chars=" +
               std::to_string(outcome.chars) + (clean ? "" : ", finish forced") + ")");
  return outcome;
}

ActionOutcome RecordingOrchestrator::Cancel() {
  ActionOutcome outcome;
  outcome.action = ActionKind::kCancel;
  if (state_ != RecordingState::kActive) {
    outcome.status = ActionStatus::kNotRecording;
    outcome.message = kMsgNotRecording;
    return outcome;
  }

  const double duration = ElapsedSeconds();
  state_ = RecordingState::kFinishing;
  Publish();
  audio_source_->Stop();

  auto session = std::move(session_);
  session->Stop();

  last_text_.clear();
  last_duration_s_ = duration;
  transcript_.clear();
  state_ = RecordingState::kIdle;
  Publish();

  if (presentation_) {
    presentation_->OnRecordingEnded(std::string(), true);
  }
  outcome.status = ActionStatus::kCancelled;
  outcome.duration_s = duration;
  outcome.message = kMsgCancelled;
  Logger::Info("[RecordingOrchestrator] Recording #" + std::to_string(recording_id_) +
               " cancelled (duration=" + Seconds(duration) + ")");
  return outcome;
}

ActionOutcome RecordingOrchestrator::Toggle() {
  return state_ == RecordingState::kIdle ? Start() : Stop();
}

void RecordingOrchestrator::Shutdown() {
  if (state_ == RecordingState::kActive) {
    Logger::Info("[RecordingOrchestrator] Cancelling active recording for shutdown");
    Cancel();
  }
}

// ======================================================================
// Cross-thread entry points
// ======================================================================

std::future<ActionOutcome> RecordingOrchestrator::Dispatch(ActionKind kind) {
  return loop_.Submit([this, kind] { return Execute(kind); });
}

RecordingSnapshot RecordingOrchestrator::Snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  RecordingSnapshot snap = published_;
  if (snap.state != RecordingState::kIdle) {
    snap.elapsed_s = static_cast<double>(clock_->NowMs() - published_start_ms_) / 1000.0;
    if (snap.elapsed_s < 0.0) snap.elapsed_s = 0.0;
  }
  snap.stream_alive = published_session_ != nullptr && !published_session_->closed();
  return snap;
}

// ======================================================================
// Session and capture callbacks (posted to the main loop)
// ======================================================================

void RecordingOrchestrator::OnSessionText(uint64_t recording_id, const std::string& text) {
  if (recording_id != recording_id_ || state_ != RecordingState::kActive) {
    Logger::Debug("[RecordingOrchestrator] Dropping text from recording #" +
                  std::to_string(recording_id));
    return;
  }
  transcript_ = text;
  Publish();
  if (presentation_) {
    presentation_->OnTranscriptUpdate(text);
  }
}

void RecordingOrchestrator::OnSessionClosed(uint64_t recording_id,
                                            StreamingSession::CloseReason reason) {
  if (recording_id != recording_id_ || state_ != RecordingState::kActive) return;
  // The recording stays active; the next stop or cancel ends it with the
  // transcript received so far.
  Logger::Warn(std::string("[RecordingOrchestrator] Stream for recording #") +
               std::to_string(recording_id) + " ended early (" +
               StreamingSession::CloseReasonName(reason) + ")");
  Publish();
}

void RecordingOrchestrator::OnCapturedAudio(uint64_t recording_id, std::vector<int16_t> samples) {
  if (recording_id != recording_id_ || state_ != RecordingState::kActive) return;
  if (presentation_) {
    presentation_->OnSamples(samples);
  }
}

// ======================================================================
// Helpers
// ======================================================================

double RecordingOrchestrator::ElapsedSeconds() const {
  const int64_t ms = clock_->NowMs() - start_ms_;
  return ms > 0 ? static_cast<double>(ms) / 1000.0 : 0.0;
}

void RecordingOrchestrator::Publish() {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  published_.state = state_;
  published_.text = transcript_;
  published_.last_text = last_text_;
  published_.last_duration_s = last_duration_s_;
  published_.recordings = recording_id_;
  published_start_ms_ = start_ms_;
  published_session_ = session_;
}

}  // namespace seedling::runtime
