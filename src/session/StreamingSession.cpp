// Repository: Seedling
// Component: Streaming Recognition Session
// Purpose: One connection to the recognizer with concurrent sender/receiver
//          tasks and bounded graceful / forced shutdown.
// Copyright (c) 2025 RetroVue

#include "seedling/session/StreamingSession.hpp"

#include <exception>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "seedling/util/Logger.hpp"
#include "seedling/util/Uuid.hpp"

namespace seedling::session {

using util::Logger;

namespace {

// Handshake frame sequence. Audio numbering starts at 1 independently.
constexpr int32_t kHandshakeSequence = 1;

std::string Ms(std::chrono::milliseconds d) {
  return std::to_string(d.count()) + "ms";
}

}  // namespace

std::shared_ptr<StreamingSession> StreamingSession::Create(StreamingSessionConfig config,
                                                           FrameChannelFactory channel_factory,
                                                           TextCallback on_text,
                                                           ClosedCallback on_closed) {
  return std::shared_ptr<StreamingSession>(new StreamingSession(
      std::move(config), std::move(channel_factory), std::move(on_text), std::move(on_closed)));
}

StreamingSession::StreamingSession(StreamingSessionConfig config,
                                   FrameChannelFactory channel_factory,
                                   TextCallback on_text, ClosedCallback on_closed)
    : config_(std::move(config)),
      channel_factory_(std::move(channel_factory)),
      on_text_(std::move(on_text)),
      on_closed_(std::move(on_closed)),
      handshake_timer_(ioc_),
      poll_timer_(ioc_),
      write_timer_(ioc_),
      close_timer_(ioc_),
      segmenter_(config_.handshake.sample_rate_hz, config_.segment_duration_ms) {
  stats_.request_id = util::GenerateUuidV4();
  request_.url = config_.url;
  request_.headers = {
      {kHeaderResourceId, config_.resource_id},
      {kHeaderRequestId, stats_.request_id},
      {kHeaderAccessKey, config_.access_key},
      {kHeaderAppKey, config_.app_key},
  };
}

StreamingSession::~StreamingSession() {
  if (worker_.joinable()) {
    // The worker holds a reference until it returns, so reaching here with a
    // joinable thread means we are on that thread.
    if (worker_.get_id() == std::this_thread::get_id()) {
      worker_.detach();
    } else {
      worker_.join();
    }
  }
}

const char* StreamingSession::StateName(State state) {
  switch (state) {
    case State::kIdle: return "idle";
    case State::kConnecting: return "connecting";
    case State::kHandshaking: return "handshaking";
    case State::kStreaming: return "streaming";
    case State::kClosing: return "closing";
    case State::kClosed: return "closed";
  }
  return "unknown";
}

const char* StreamingSession::CloseReasonName(CloseReason reason) {
  switch (reason) {
    case CloseReason::kNone: return "none";
    case CloseReason::kCompleted: return "completed";
    case CloseReason::kRemoteError: return "remote_error";
    case CloseReason::kTransportError: return "transport_error";
    case CloseReason::kCancelled: return "cancelled";
  }
  return "unknown";
}

// ======================================================================
// Owner-facing API
// ======================================================================

void StreamingSession::Start() {
  if (started_) return;
  started_ = true;
  SetState(State::kConnecting);
  auto self = shared_from_this();
  worker_ = std::thread([self] { self->Run(); });
}

void StreamingSession::FeedAudio(const uint8_t* data, size_t len) {
  if (closed()) return;
  queue_.Push(data, len);
}

bool StreamingSession::Finish() {
  queue_.PushStop();
  if (!started_) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.state = State::kClosed;
    stats_.close_reason = CloseReason::kCancelled;
    return false;
  }

  Logger::Info("[StreamingSession] Finishing (timeout=" + Ms(config_.finish_timeout) + ")");
  if (WaitClosed(config_.finish_timeout)) {
    ReleaseWorker(true);
    return stats().close_reason != CloseReason::kCancelled;
  }

  Logger::Warn("[StreamingSession] Finish timed out after " + Ms(config_.finish_timeout) +
               ", forcing close");
  RequestCancel();
  const bool closed = WaitClosed(config_.force_close_grace);
  if (!closed) {
    Logger::Warn("[StreamingSession] Worker still running after " +
                 Ms(config_.force_close_grace) + " grace, abandoning it");
  }
  ReleaseWorker(closed);
  return false;
}

void StreamingSession::Stop() {
  if (!started_) {
    queue_.PushStop();
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.state = State::kClosed;
    stats_.close_reason = CloseReason::kCancelled;
    return;
  }

  Logger::Info("[StreamingSession] Stopping");
  // Flag before sentinel: a sender that sees the sentinel also sees the flag.
  RequestCancel();
  queue_.PushStop();
  const bool closed = WaitClosed(config_.stop_timeout);
  if (!closed) {
    Logger::Warn("[StreamingSession] Worker did not exit within " + Ms(config_.stop_timeout) +
                 ", abandoning it");
  }
  ReleaseWorker(closed);
}

StreamingSession::State StreamingSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_.state;
}

StreamingSession::Stats StreamingSession::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::string StreamingSession::LatestText() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_text_;
}

bool StreamingSession::WaitClosed(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return closed_cv_.wait_for(lock, timeout, [this] { return stats_.state == State::kClosed; });
}

void StreamingSession::ReleaseWorker(bool closed) {
  if (!worker_.joinable()) return;
  if (closed && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  } else {
    // The thread keeps its own reference and releases it when it returns.
    worker_.detach();
  }
}

void StreamingSession::RequestCancel() {
  cancel_requested_.store(true, std::memory_order_release);
  std::weak_ptr<StreamingSession> weak = weak_from_this();
  boost::asio::post(ioc_, [weak] {
    if (auto self = weak.lock()) {
      self->ForceCancel();
    }
  });
}

// ======================================================================
// Worker
// ======================================================================

void StreamingSession::Run() {
  Logger::Info("[StreamingSession] Connecting to " + config_.url +
               " (request_id=" + stats().request_id + ")");
  try {
    channel_ = channel_factory_(ioc_, config_.url);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[StreamingSession] Cannot create channel: ") + e.what());
  }

  if (!channel_) {
    SetCloseReason(CloseReason::kTransportError);
  } else {
    channel_->AsyncConnect(request_, [this](const boost::system::error_code& ec) {
      OnConnected(ec);
    });
    for (;;) {
      try {
        ioc_.run();
        break;
      } catch (const std::exception& e) {
        // Drop the connection; remaining handlers complete with errors.
        Logger::Error(std::string("[StreamingSession] Task failed: ") + e.what());
        SetCloseReason(CloseReason::kTransportError);
        handshake_timer_.cancel();
        poll_timer_.cancel();
        write_timer_.cancel();
        close_timer_.cancel();
        channel_->Close();
      }
    }
  }

  // Nothing drains the queue from here on.
  const size_t dropped = queue_.Close();
  if (dropped > 0) {
    Logger::Debug("[StreamingSession] Dropped " + std::to_string(dropped) +
                  " unsent audio chunk(s)");
  }

  Stats final_stats;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stats_.close_reason == CloseReason::kNone) {
      stats_.close_reason = cancel_requested_.load(std::memory_order_acquire)
                                ? CloseReason::kCancelled
                                : CloseReason::kTransportError;
    }
    stats_.state = State::kClosed;
    final_stats = stats_;
  }
  closed_cv_.notify_all();

  Logger::Info(std::string("[StreamingSession] Closed (reason=") +
               CloseReasonName(final_stats.close_reason) +
               ", segments=" + std::to_string(final_stats.segments_sent) +
               ", final=" + (final_stats.final_sent ? "yes" : "no") +
               ", frames_received=" + std::to_string(final_stats.frames_received) + ")");

  if (on_closed_) {
    try {
      on_closed_(final_stats.close_reason);
    } catch (const std::exception& e) {
      Logger::Error(std::string("[StreamingSession] Close callback threw: ") + e.what());
    }
  }
}

void StreamingSession::OnConnected(const boost::system::error_code& ec) {
  if (ec) {
    if (!cancel_requested_) {
      Logger::Error("[StreamingSession] Connect failed: " + ec.message());
    }
    ReceiverDone(cancel_requested_ ? CloseReason::kCancelled : CloseReason::kTransportError,
                 false);
    return;
  }
  if (cancel_requested_) {
    ReceiverDone(CloseReason::kCancelled, false);
    return;
  }

  SetState(State::kHandshaking);
  Logger::Info("[StreamingSession] Connected, sending handshake");
  ArmWriteWatchdog();
  channel_->AsyncWrite(protocol::BuildHandshakeFrame(kHandshakeSequence, config_.handshake),
                       [this](const boost::system::error_code& ec) { OnHandshakeWritten(ec); });
}

void StreamingSession::OnHandshakeWritten(const boost::system::error_code& ec) {
  write_timer_.cancel();
  if (ec) {
    if (!cancel_requested_) {
      Logger::Error("[StreamingSession] Handshake write failed: " + ec.message());
    }
    ReceiverDone(cancel_requested_ ? CloseReason::kCancelled : CloseReason::kTransportError,
                 false);
    return;
  }

  handshake_timer_.expires_after(config_.handshake_timeout);
  handshake_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || streaming_started_ || receiver_done_) return;
    Logger::Warn("[StreamingSession] No handshake reply within " +
                 Ms(config_.handshake_timeout) + ", streaming anyway");
    EnterStreaming();
  });
  ReadNext();
}

void StreamingSession::EnterStreaming() {
  if (streaming_started_ || receiver_done_ || close_started_ || cancel_requested_) return;
  streaming_started_ = true;
  SetState(State::kStreaming);
  Logger::Info("[StreamingSession] Streaming audio");
  PollQueue();
}

// ----------------------------------------------------------------------
// Receiver
// ----------------------------------------------------------------------

void StreamingSession::ReadNext() {
  channel_->AsyncRead([this](const boost::system::error_code& ec, std::vector<uint8_t> bytes) {
    OnRead(ec, std::move(bytes));
  });
}

void StreamingSession::OnRead(const boost::system::error_code& ec, std::vector<uint8_t> bytes) {
  if (ec) {
    const bool expected = cancel_requested_ || (sender_done_ && !sender_ok_) ||
                          ec == boost::asio::error::operation_aborted;
    if (expected) {
      Logger::Debug("[StreamingSession] Receiver stopped: " + ec.message());
    } else {
      Logger::Warn("[StreamingSession] Connection lost: " + ec.message());
    }
    ReceiverDone(cancel_requested_ ? CloseReason::kCancelled : CloseReason::kTransportError,
                 false);
    return;
  }

  protocol::Frame frame;
  try {
    frame = protocol::ParseFrame(bytes);
  } catch (const protocol::FrameFormatError& e) {
    Logger::Warn(std::string("[StreamingSession] Dropping malformed frame: ") + e.what());
    if (!streaming_started_) {
      // An unreadable handshake reply still counts as a reply.
      handshake_timer_.cancel();
      EnterStreaming();
    }
    ReadNext();
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.frames_received;
  }
  if (Logger::DebugEnabled()) {
    Logger::Debug("[StreamingSession] <- " + protocol::DescribeFrame(frame));
  }

  if (!streaming_started_) {
    handshake_timer_.cancel();
    Logger::Info("[StreamingSession] Handshake acknowledged");
    EnterStreaming();
  }

  if (auto text = protocol::ExtractRecognizedText(frame)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      latest_text_ = *text;
    }
    if (on_text_) {
      on_text_(*text);
    }
  }

  if (frame.code != 0) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stats_.last_error_code = frame.code;
    }
    std::string detail;
    if (frame.message) {
      detail = " " + frame.message->Serialize();
    }
    Logger::Error("[StreamingSession] Recognizer error code " + std::to_string(frame.code) + detail);
    ReceiverDone(CloseReason::kRemoteError, false);
    return;
  }
  if (frame.is_last) {
    Logger::Info("[StreamingSession] Last package received");
    ReceiverDone(CloseReason::kCompleted, true);
    return;
  }
  ReadNext();
}

void StreamingSession::ReceiverDone(CloseReason reason, bool normal) {
  if (receiver_done_) return;
  receiver_done_ = true;
  receiver_ok_ = normal;
  SetCloseReason(reason);
  handshake_timer_.cancel();
  if (streaming_started_ && !sender_done_) {
    CancelSender();
  }
  MaybeClose();
}

// ----------------------------------------------------------------------
// Sender
// ----------------------------------------------------------------------

void StreamingSession::PollQueue() {
  if (sender_done_) return;
  if (sender_cancel_requested_ || cancel_requested_) {
    SenderDone(false);
    return;
  }

  std::vector<uint8_t> chunk;
  while (!stop_seen_) {
    const auto r = queue_.TryPop(&chunk);
    if (r == audio::ChunkQueue::PopResult::kChunk) {
      for (auto& segment : segmenter_.Push(chunk)) {
        pending_segments_.push_back(std::move(segment));
      }
    } else if (r == audio::ChunkQueue::PopResult::kStop) {
      stop_seen_ = true;
    } else {
      break;
    }
  }

  if (!pending_segments_.empty()) {
    std::vector<uint8_t> segment = std::move(pending_segments_.front());
    pending_segments_.pop_front();
    const int32_t seq = next_sequence_;
    WriteSegment(protocol::BuildAudioSegmentFrame(seq, segment, false), seq, false);
    return;
  }

  if (stop_seen_) {
    if (cancel_requested_) {
      SenderDone(false);
      return;
    }
    const std::vector<uint8_t> rest = segmenter_.DrainFinal();
    const int32_t seq = next_sequence_;
    Logger::Info("[StreamingSession] Sending terminal frame (seq=" + std::to_string(-seq) +
                 ", bytes=" + std::to_string(rest.size()) + ")");
    WriteSegment(protocol::BuildAudioSegmentFrame(seq, rest, true), -seq, true);
    return;
  }

  poll_timer_.expires_after(config_.poll_interval);
  poll_timer_.async_wait([this](const boost::system::error_code&) { PollQueue(); });
}

void StreamingSession::WriteSegment(std::vector<uint8_t> frame, int32_t wire_sequence,
                                    bool is_final) {
  write_in_flight_ = true;
  ArmWriteWatchdog();
  channel_->AsyncWrite(std::move(frame), [this, wire_sequence, is_final](
                                             const boost::system::error_code& ec) {
    write_in_flight_ = false;
    write_timer_.cancel();
    if (ec) {
      if (!cancel_requested_ && !sender_cancel_requested_) {
        Logger::Error("[StreamingSession] Audio write failed (seq=" +
                      std::to_string(wire_sequence) + "): " + ec.message());
        SetCloseReason(CloseReason::kTransportError);
      }
      SenderDone(false);
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (is_final) {
        stats_.final_sent = true;
      } else {
        ++stats_.segments_sent;
      }
      stats_.last_sequence = wire_sequence;
    }
    if (is_final) {
      Logger::Debug("[StreamingSession] Terminal frame sent");
      SenderDone(true);
      return;
    }
    ++next_sequence_;
    PollQueue();
  });
}

void StreamingSession::ArmWriteWatchdog() {
  write_timer_.expires_after(config_.send_timeout);
  write_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) return;
    Logger::Error("[StreamingSession] Write did not complete within " +
                  Ms(config_.send_timeout) + ", dropping connection");
    SetCloseReason(CloseReason::kTransportError);
    channel_->Close();
  });
}

void StreamingSession::SenderDone(bool normal) {
  if (sender_done_) return;
  sender_done_ = true;
  sender_ok_ = normal;
  poll_timer_.cancel();
  if (!normal && !receiver_done_) {
    // The only way to interrupt a pending read is to drop the connection.
    channel_->Close();
  }
  MaybeClose();
}

void StreamingSession::CancelSender() {
  sender_cancel_requested_ = true;
  poll_timer_.cancel();
}

// ----------------------------------------------------------------------
// Shutdown
// ----------------------------------------------------------------------

void StreamingSession::ForceCancel() {
  if (!channel_) return;
  Logger::Debug("[StreamingSession] Cancel requested");
  if (close_started_) {
    close_timer_.cancel();
    channel_->Close();
    return;
  }
  SetCloseReason(CloseReason::kCancelled);
  handshake_timer_.cancel();
  if (streaming_started_ && !sender_done_) {
    CancelSender();
  }
  channel_->Close();
}

void StreamingSession::MaybeClose() {
  const bool sender_finished = sender_done_ || !streaming_started_;
  if (!sender_finished || !receiver_done_ || close_started_) return;
  close_started_ = true;
  SetState(State::kClosing);
  handshake_timer_.cancel();
  poll_timer_.cancel();
  write_timer_.cancel();

  const bool graceful = sender_ok_ && receiver_ok_ && !cancel_requested_;
  if (!graceful) {
    channel_->Close();
    return;
  }

  close_timer_.expires_after(config_.close_timeout);
  close_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) return;
    Logger::Warn("[StreamingSession] Close handshake timed out, dropping connection");
    channel_->Close();
  });
  channel_->AsyncClose([this](const boost::system::error_code& ec) {
    close_timer_.cancel();
    if (ec) {
      Logger::Debug("[StreamingSession] Close handshake ended: " + ec.message());
      channel_->Close();
    }
  });
}

void StreamingSession::SetState(State s) {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.state = s;
}

void StreamingSession::SetCloseReason(CloseReason reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stats_.close_reason == CloseReason::kNone) {
    stats_.close_reason = reason;
  }
}

}  // namespace seedling::session
