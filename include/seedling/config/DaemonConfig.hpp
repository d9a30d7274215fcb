// Repository: Seedling
// Component: Daemon Configuration
// Purpose: Defaults, environment and command-line settings for seedlingd.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_CONFIG_DAEMON_CONFIG_HPP_
#define SEEDLING_CONFIG_DAEMON_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "seedling/session/StreamingSession.hpp"

namespace seedling::config {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

constexpr uint16_t kDefaultPort = 18888;
constexpr const char* kDefaultBindAddress = "127.0.0.1";
constexpr int kDefaultHttpThreads = 2;

// Environment variable names.
constexpr const char* kEnvPort = "SEEDLING_DAEMON_PORT";
constexpr const char* kEnvLegacyPort = "DOUBAO_DAEMON_PORT";  // not honoured
constexpr const char* kEnvBindAddress = "SEEDLING_BIND_ADDRESS";
constexpr const char* kEnvAsrUrl = "SEEDLING_ASR_URL";
constexpr const char* kEnvAppKey = "SEEDLING_APP_KEY";
constexpr const char* kEnvAccessKey = "SEEDLING_ACCESS_KEY";
constexpr const char* kEnvResourceId = "SEEDLING_RESOURCE_ID";
constexpr const char* kEnvAudioSource = "SEEDLING_AUDIO_SOURCE";
constexpr const char* kEnvContext = "SEEDLING_CONTEXT";  // newline-separated lines

struct DaemonConfig {
  uint16_t port = kDefaultPort;
  std::string bind_address = kDefaultBindAddress;
  int http_threads = kDefaultHttpThreads;

  // "portaudio", "stdin" / "-", or a path to a FIFO or raw PCM file.
  std::string audio_source;

  session::StreamingSessionConfig session;

  bool show_help = false;

  // Non-fatal observations made while loading (legacy variables, missing
  // credentials). main() logs them once the logger is up.
  std::vector<std::string> warnings;
};

using EnvLookup = std::function<const char*(const char*)>;

// Built-in defaults. `portaudio_available` selects the default audio source.
DaemonConfig DefaultDaemonConfig(bool portaudio_available);

// Overlays SEEDLING_* variables. Throws ConfigError on malformed values.
void ApplyEnvironment(DaemonConfig& config, const EnvLookup& getenv_fn);

// Overlays flags. Throws ConfigError for unknown flags, missing values or
// malformed numbers.
void ApplyCommandLine(DaemonConfig& config, int argc, const char* const* argv);

// Cross-field checks plus credential warnings. Throws ConfigError.
void Validate(DaemonConfig& config);

// defaults -> environment -> command line -> Validate.
DaemonConfig LoadDaemonConfig(int argc, const char* const* argv, bool portaudio_available,
                              const EnvLookup& getenv_fn);

std::string UsageText(const char* program_name);

}  // namespace seedling::config

#endif  // SEEDLING_CONFIG_DAEMON_CONFIG_HPP_
