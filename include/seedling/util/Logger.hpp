// Repository: Seedling
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, timestamped log emission shared by every thread.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_UTIL_LOGGER_HPP_
#define SEEDLING_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace seedling::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes "[HH:MM:SS.mmm] <line>", appends '\n',
// and flushes, so lines from the main loop, the session worker, the capture
// thread and the HTTP workers never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when SEEDLING_DEBUG env is set (frame-level tracing)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failures that end a session or an action)
//
// Callers prefix the line with their component, e.g. "[StreamingSession] ...".
//
// Test-only: SetErrorSink / SetInfoSink install a callback invoked with the
// raw (unprefixed) line in addition to the stream write.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // Test-only: call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::string Timestamp();

  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace seedling::util

#endif  // SEEDLING_UTIL_LOGGER_HPP_
