// Repository: Seedling
// Component: Streaming Recognition Session
// Purpose: One connection to the recognizer with concurrent sender/receiver
//          tasks and bounded graceful / forced shutdown.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_SESSION_STREAMING_SESSION_HPP_
#define SEEDLING_SESSION_STREAMING_SESSION_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "seedling/audio/AudioSegmenter.hpp"
#include "seedling/audio/ChunkQueue.hpp"
#include "seedling/protocol/AsrProtocol.hpp"
#include "seedling/session/IFrameChannel.hpp"

namespace seedling::session {

constexpr const char* kHeaderResourceId = "X-Api-Resource-Id";
constexpr const char* kHeaderRequestId = "X-Api-Request-Id";
constexpr const char* kHeaderAccessKey = "X-Api-Access-Key";
constexpr const char* kHeaderAppKey = "X-Api-App-Key";

constexpr const char* kDefaultAsrUrl =
    "wss://openspeech.bytedance.com/api/v3/sauc/bigmodel_async";
constexpr const char* kDefaultResourceId = "volc.seedasr.sauc.duration";

struct StreamingSessionConfig {
  std::string url = kDefaultAsrUrl;
  std::string app_key;
  std::string access_key;
  std::string resource_id = kDefaultResourceId;
  protocol::HandshakeRequest handshake;
  int segment_duration_ms = audio::AudioSegmenter::kDefaultSegmentMs;

  // Sender wake-up period while the audio queue is empty. Bounds how quickly
  // a stop sentinel or cancellation is observed.
  std::chrono::milliseconds poll_interval{100};
  // How long the handshake reply may take before streaming starts anyway.
  std::chrono::milliseconds handshake_timeout{2000};
  // Upper bound for one frame write; on expiry the connection is dropped.
  std::chrono::milliseconds send_timeout{2000};
  // Upper bound for the WebSocket close handshake.
  std::chrono::milliseconds close_timeout{500};

  // Finish(): natural termination wait, then the post-cancel grace.
  std::chrono::milliseconds finish_timeout{1500};
  std::chrono::milliseconds force_close_grace{300};
  // Stop(): bounded join after the immediate close.
  std::chrono::milliseconds stop_timeout{500};
};

// StreamingSession owns one recognizer connection for the length of one
// recording. Lifecycle:
//
//   Connecting -> Handshaking -> Streaming -> Closing -> Closed
//
// A dedicated worker thread runs a private io_context. On it two cooperative
// tasks share the channel:
//   - sender:   drains the audio queue through the segmenter, one frame per
//               full segment, then a terminal frame after the stop sentinel;
//   - receiver: reads frames, reports recognized text, ends on the last-package
//               flag, a remote error code, or transport failure.
// The receiver ending cancels the sender. The sender failing or being
// cancelled cancels the receiver. A sender that completed normally leaves the
// receiver running so it can observe the acknowledgment of the terminal frame.
//
// Thread model: FeedAudio() may be called from any thread. Start(), Finish()
// and Stop() are called by the owner (the main loop). Text and close
// callbacks run on the worker thread; owners must marshal them.
class StreamingSession : public std::enable_shared_from_this<StreamingSession> {
 public:
  enum class State { kIdle, kConnecting, kHandshaking, kStreaming, kClosing, kClosed };

  enum class CloseReason {
    kNone,            // still running
    kCompleted,       // last package received
    kRemoteError,     // error response with a non-zero code
    kTransportError,  // connect, read or write failure
    kCancelled,       // forced stop or finish timeout
  };

  struct Stats {
    State state = State::kIdle;
    CloseReason close_reason = CloseReason::kNone;
    int64_t segments_sent = 0;      // non-terminal audio frames
    bool final_sent = false;
    int32_t last_sequence = 0;      // as transmitted (terminal is negative)
    int64_t frames_received = 0;    // including the handshake reply
    int32_t last_error_code = 0;
    std::string request_id;
  };

  using TextCallback = std::function<void(const std::string& text)>;
  using ClosedCallback = std::function<void(CloseReason reason)>;

  static std::shared_ptr<StreamingSession> Create(StreamingSessionConfig config,
                                                  FrameChannelFactory channel_factory,
                                                  TextCallback on_text,
                                                  ClosedCallback on_closed = nullptr);
  ~StreamingSession();

  StreamingSession(const StreamingSession&) = delete;
  StreamingSession& operator=(const StreamingSession&) = delete;

  // Spawns the worker and begins connecting. Call once.
  void Start();

  // Thread-safe. Ignored once the stop sentinel has been queued or the
  // session has closed.
  void FeedAudio(const uint8_t* data, size_t len);

  // Graceful finish. Queues the stop sentinel and waits up to finish_timeout
  // for the session to close on its own; otherwise cancels and waits
  // force_close_grace more. Returns true when the session closed without
  // being cancelled. Never blocks longer than the sum of the two bounds.
  bool Finish();

  // Forced stop. Queues the stop sentinel, closes the connection at once and
  // waits up to stop_timeout for the worker.
  void Stop();

  State state() const;
  Stats stats() const;
  bool closed() const { return state() == State::kClosed; }

  // Audio chunks accepted but not yet segmented.
  size_t queued_chunks() const { return queue_.size(); }

  // Most recent non-empty recognized text, empty if none arrived.
  std::string LatestText() const;

  // The headers sent with the upgrade request for this session.
  const ConnectionRequest& connection_request() const { return request_; }

  static const char* StateName(State state);
  static const char* CloseReasonName(CloseReason reason);

 private:
  StreamingSession(StreamingSessionConfig config, FrameChannelFactory channel_factory,
                   TextCallback on_text, ClosedCallback on_closed);

  // Worker thread body.
  void Run();

  // All of the following run on the worker's io_context.
  void OnConnected(const boost::system::error_code& ec);
  void OnHandshakeWritten(const boost::system::error_code& ec);
  void EnterStreaming();

  void ReadNext();
  void OnRead(const boost::system::error_code& ec, std::vector<uint8_t> bytes);
  void ReceiverDone(CloseReason reason, bool normal);

  void PollQueue();
  void WriteSegment(std::vector<uint8_t> frame, int32_t wire_sequence, bool is_final);
  void ArmWriteWatchdog();
  void SenderDone(bool normal);
  void CancelSender();

  void ForceCancel();
  void MaybeClose();

  void SetState(State s);
  void SetCloseReason(CloseReason reason);

  // Blocks the caller until Closed or the deadline passes.
  bool WaitClosed(std::chrono::milliseconds timeout);
  // Joins the worker if it has ended, otherwise leaves it running detached.
  void ReleaseWorker(bool closed);
  void RequestCancel();

  StreamingSessionConfig config_;
  FrameChannelFactory channel_factory_;
  TextCallback on_text_;
  ClosedCallback on_closed_;
  ConnectionRequest request_;

  boost::asio::io_context ioc_;
  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer poll_timer_;
  boost::asio::steady_timer write_timer_;
  boost::asio::steady_timer close_timer_;
  std::unique_ptr<IFrameChannel> channel_;

  audio::ChunkQueue queue_;
  audio::AudioSegmenter segmenter_;
  std::deque<std::vector<uint8_t>> pending_segments_;
  bool stop_seen_ = false;
  int32_t next_sequence_ = 1;

  // Worker-only task flags.
  bool streaming_started_ = false;
  bool sender_done_ = false;
  bool sender_ok_ = false;
  bool sender_cancel_requested_ = false;
  bool write_in_flight_ = false;
  bool receiver_done_ = false;
  bool receiver_ok_ = false;
  bool close_started_ = false;
  std::atomic<bool> cancel_requested_{false};

  std::thread worker_;
  bool started_ = false;

  mutable std::mutex mutex_;  // guards stats_, latest_text_
  std::condition_variable closed_cv_;
  Stats stats_;
  std::string latest_text_;
};

}  // namespace seedling::session

#endif  // SEEDLING_SESSION_STREAMING_SESSION_HPP_
