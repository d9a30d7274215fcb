// Repository: Seedling
// Component: Pipe Audio Source
// Purpose: Reads raw s16le mono PCM from stdin, a FIFO or any readable fd.
// Copyright (c) 2025 RetroVue

#include "seedling/audio/PipeAudioSource.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "seedling/util/Logger.hpp"

namespace seedling::audio {

using util::Logger;

namespace {
// Upper bound on how long Stop()/destruction waits for the reader to notice.
constexpr int kPollTimeoutMs = 100;
}  // namespace

PipeAudioSource::PipeAudioSource(int fd, bool owns_fd, size_t read_bytes)
    : fd_(fd), owns_fd_(owns_fd), read_bytes_(read_bytes > 0 ? read_bytes : kDefaultReadBytes) {
  reader_thread_ = std::thread(&PipeAudioSource::ReaderLoop, this);
}

PipeAudioSource::~PipeAudioSource() {
  Stop();
  reader_stop_.store(true, std::memory_order_release);
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
}

std::unique_ptr<PipeAudioSource> PipeAudioSource::Open(const std::string& path) {
  if (path == "-" || path == "stdin") {
    return std::make_unique<PipeAudioSource>(STDIN_FILENO, false);
  }
  const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    throw AudioSourceError("cannot open audio input '" + path + "': " +
                           std::strerror(errno));
  }
  return std::make_unique<PipeAudioSource>(fd, true);
}

void PipeAudioSource::Start(AudioChunkCallback on_chunk) {
  if (eof_.load(std::memory_order_acquire)) {
    throw AudioSourceError("audio input reached end of stream");
  }
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_chunk_ = std::move(on_chunk);
  Logger::Info("[PipeAudioSource] Capture started (fd=" + std::to_string(fd_) + ")");
}

void PipeAudioSource::Stop() {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  if (on_chunk_) {
    on_chunk_ = nullptr;
    Logger::Info("[PipeAudioSource] Capture stopped");
  }
}

void PipeAudioSource::ReaderLoop() {
  std::vector<uint8_t> buf(read_bytes_);
  // s16 samples must not be split across chunks; carry an odd byte forward.
  size_t carry = 0;

  while (!reader_stop_.load(std::memory_order_acquire)) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int pr = ::poll(&pfd, 1, kPollTimeoutMs);
    if (pr < 0) {
      if (errno == EINTR) continue;
      Logger::Error("[PipeAudioSource] poll failed: " + std::string(std::strerror(errno)));
      break;
    }
    if (pr == 0) continue;

    const ssize_t n = ::read(fd_, buf.data() + carry, buf.size() - carry);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      Logger::Error("[PipeAudioSource] read failed: " + std::string(std::strerror(errno)));
      break;
    }
    if (n == 0) {
      Logger::Warn("[PipeAudioSource] Audio input closed by writer");
      break;
    }

    const size_t total = carry + static_cast<size_t>(n);
    const size_t whole = total & ~static_cast<size_t>(1);
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      if (on_chunk_ && whole > 0) {
        on_chunk_(buf.data(), whole);
      }
    }
    carry = total - whole;
    if (carry > 0) {
      buf[0] = buf[whole];
    }
  }
  eof_.store(true, std::memory_order_release);
}

}  // namespace seedling::audio
