// Repository: Seedling
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, timestamped log emission shared by every thread.
// Copyright (c) 2025 RetroVue

#include "seedling/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace seedling::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("SEEDLING_DEBUG") != nullptr;
}

std::string Logger::Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count();
  const time_t s = static_cast<time_t>(ms / 1000);
  struct tm tm;
  if (localtime_r(&s, &tm) == nullptr) return "[--:--:--.---]";
  char buf[32];
  const int n = snprintf(buf, sizeof(buf), "[%02d:%02d:%02d.%03d]",
                         tm.tm_hour, tm.tm_min, tm.tm_sec,
                         static_cast<int>(ms % 1000));
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "[--:--:--.---]";
  return std::string(buf, static_cast<size_t>(n));
}

void Logger::Info(const std::string& line) {
  const std::string stamp = Timestamp();
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << stamp << ' ' << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  const std::string stamp = Timestamp();
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << stamp << ' ' << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  const std::string stamp = Timestamp();
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << stamp << ' ' << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  const std::string stamp = Timestamp();
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << stamp << ' ' << line << '\n';
  std::cerr.flush();
}

}  // namespace seedling::util
