// Repository: Seedling
// Component: Daemon Configuration
// Purpose: Defaults, environment and command-line settings for seedlingd.
// Copyright (c) 2025 RetroVue

#include "seedling/config/DaemonConfig.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace seedling::config {

namespace {

int64_t ParseInteger(const std::string& what, const std::string& text, int64_t min_value,
                     int64_t max_value) {
  if (text.empty()) {
    throw ConfigError(what + ": empty value");
  }
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    throw ConfigError(what + ": not an integer: '" + text + "'");
  }
  if (v < min_value || v > max_value) {
    throw ConfigError(what + ": " + text + " out of range [" + std::to_string(min_value) + ", " +
                      std::to_string(max_value) + "]");
  }
  return static_cast<int64_t>(v);
}

uint16_t ParsePort(const std::string& what, const std::string& text) {
  return static_cast<uint16_t>(ParseInteger(what, text, 1, 65535));
}

std::chrono::milliseconds ParseMillis(const std::string& what, const std::string& text) {
  return std::chrono::milliseconds(ParseInteger(what, text, 1, 600000));
}

// Non-blank lines, trimmed.
std::vector<std::string> SplitContextLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    const auto begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) continue;
    const auto end = line.find_last_not_of(" \t\r");
    lines.push_back(line.substr(begin, end - begin + 1));
  }
  return lines;
}

}  // namespace

DaemonConfig DefaultDaemonConfig(bool portaudio_available) {
  DaemonConfig config;
  config.audio_source = portaudio_available ? "portaudio" : "stdin";
  return config;
}

void ApplyEnvironment(DaemonConfig& config, const EnvLookup& getenv_fn) {
  auto get = [&getenv_fn](const char* name) -> std::string {
    const char* v = getenv_fn(name);
    return v != nullptr ? std::string(v) : std::string();
  };

  if (!get(kEnvLegacyPort).empty()) {
    config.warnings.push_back(std::string(kEnvLegacyPort) + " is ignored; set " + kEnvPort +
                              " instead");
  }
  if (const std::string v = get(kEnvPort); !v.empty()) {
    config.port = ParsePort(kEnvPort, v);
  }
  if (const std::string v = get(kEnvBindAddress); !v.empty()) {
    config.bind_address = v;
  }
  if (const std::string v = get(kEnvAsrUrl); !v.empty()) {
    config.session.url = v;
  }
  if (const std::string v = get(kEnvAppKey); !v.empty()) {
    config.session.app_key = v;
  }
  if (const std::string v = get(kEnvAccessKey); !v.empty()) {
    config.session.access_key = v;
  }
  if (const std::string v = get(kEnvResourceId); !v.empty()) {
    config.session.resource_id = v;
  }
  if (const std::string v = get(kEnvAudioSource); !v.empty()) {
    config.audio_source = v;
  }
  if (const std::string v = get(kEnvContext); !v.empty()) {
    config.session.handshake.context_lines = SplitContextLines(v);
  }
}

void ApplyCommandLine(DaemonConfig& config, int argc, const char* const* argv) {
  bool context_from_flags = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw ConfigError(arg + " requires a value");
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--port") {
      config.port = ParsePort("--port", value());
    } else if (arg == "--bind") {
      config.bind_address = value();
    } else if (arg == "--asr-url") {
      config.session.url = value();
    } else if (arg == "--audio") {
      config.audio_source = value();
    } else if (arg == "--context") {
      // Flags replace any lines from the environment; repeats append.
      auto& lines = config.session.handshake.context_lines;
      if (!context_from_flags) {
        lines.clear();
        context_from_flags = true;
      }
      for (auto& line : SplitContextLines(value())) {
        lines.push_back(std::move(line));
      }
    } else if (arg == "--finish-timeout-ms") {
      config.session.finish_timeout = ParseMillis("--finish-timeout-ms", value());
    } else if (arg == "--cancel-timeout-ms") {
      config.session.stop_timeout = ParseMillis("--cancel-timeout-ms", value());
    } else if (arg == "--poll-interval-ms") {
      config.session.poll_interval = ParseMillis("--poll-interval-ms", value());
    } else if (arg == "--http-threads") {
      config.http_threads = static_cast<int>(ParseInteger("--http-threads", value(), 1, 64));
    } else {
      throw ConfigError("unknown argument: " + arg);
    }
  }
}

void Validate(DaemonConfig& config) {
  if (config.session.url.rfind("wss://", 0) != 0 && config.session.url.rfind("ws://", 0) != 0) {
    throw ConfigError("ASR url must start with ws:// or wss://: '" + config.session.url + "'");
  }
  if (config.bind_address.empty()) {
    throw ConfigError("bind address is empty");
  }
  if (config.audio_source.empty()) {
    throw ConfigError("audio source is empty");
  }
  if (config.session.app_key.empty()) {
    config.warnings.push_back(std::string(kEnvAppKey) +
                              " is not set; the recognizer will reject the connection");
  }
  if (config.session.access_key.empty()) {
    config.warnings.push_back(std::string(kEnvAccessKey) +
                              " is not set; the recognizer will reject the connection");
  }
}

DaemonConfig LoadDaemonConfig(int argc, const char* const* argv, bool portaudio_available,
                              const EnvLookup& getenv_fn) {
  DaemonConfig config = DefaultDaemonConfig(portaudio_available);
  ApplyEnvironment(config, getenv_fn);
  ApplyCommandLine(config, argc, argv);
  if (!config.show_help) {
    Validate(config);
  }
  return config;
}

std::string UsageText(const char* program_name) {
  std::ostringstream o;
  o << "Usage: " << program_name << " [OPTIONS]\n"
    << "\n"
    << "Streaming speech recognition daemon with a local HTTP control surface.\n"
    << "\n"
    << "OPTIONS:\n"
    << "  --port N               HTTP port (default " << kDefaultPort << ", env " << kEnvPort
    << ")\n"
    << "  --bind ADDR            HTTP bind address (default " << kDefaultBindAddress << ", env "
    << kEnvBindAddress << ")\n"
    << "  --asr-url URL          Recognizer endpoint, ws:// or wss:// (env " << kEnvAsrUrl
    << ")\n"
    << "  --audio SOURCE         portaudio | stdin | PATH to raw s16le 16 kHz mono PCM (env "
    << kEnvAudioSource << ")\n"
    << "  --context TEXT         Dialog context line sent with the handshake; repeatable\n"
    << "                         (env " << kEnvContext << ", one line per row)\n"
    << "  --finish-timeout-ms N  Graceful stop wait (default 1500)\n"
    << "  --cancel-timeout-ms N  Forced stop wait (default 500)\n"
    << "  --poll-interval-ms N   Audio queue poll period (default 100)\n"
    << "  --http-threads N       HTTP worker threads (default " << kDefaultHttpThreads << ")\n"
    << "  --help                 Show this help message\n"
    << "\n"
    << "CREDENTIALS (environment only):\n"
    << "  " << kEnvAppKey << ", " << kEnvAccessKey << ", " << kEnvResourceId << "\n"
    << "\n"
    << "ENDPOINTS (GET or POST):\n"
    << "  /start /stop /cancel /toggle   recording control\n"
    << "  /status /health                read-only (GET)\n"
    << "\n"
    << "EXAMPLE:\n"
    << "  arecord -q -t raw -f S16_LE -r 16000 -c 1 | " << program_name << " --audio stdin\n"
    << "  curl -X POST http://127.0.0.1:" << kDefaultPort << "/toggle\n";
  return o.str();
}

}  // namespace seedling::config
