// Repository: Seedling
// Component: seedlingd
// Purpose: Daemon entry point. Wires audio capture, the recognizer session
//          factory, the recording orchestrator and the HTTP control plane.
// Copyright (c) 2025 RetroVue

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio/signal_set.hpp>

#include "seedling/audio/PipeAudioSource.hpp"
#include "seedling/config/DaemonConfig.hpp"
#include "seedling/control/ControlApi.hpp"
#include "seedling/control/ControlServer.hpp"
#include "seedling/runtime/LogPresentationSink.hpp"
#include "seedling/runtime/MainLoop.hpp"
#include "seedling/runtime/RecordingOrchestrator.hpp"
#include "seedling/session/WebSocketChannel.hpp"
#include "seedling/util/Logger.hpp"
#include "time/SystemTimeSource.hpp"

#ifdef SEEDLING_WITH_PORTAUDIO
#include "seedling/audio/PortAudioSource.hpp"
#endif

namespace {

using seedling::util::Logger;

#ifdef SEEDLING_WITH_PORTAUDIO
constexpr bool kPortAudioAvailable = true;
#else
constexpr bool kPortAudioAvailable = false;
#endif

constexpr int kExitConfigError = 2;
constexpr int kExitStartupError = 1;

std::shared_ptr<seedling::audio::IAudioSource> MakeAudioSource(const std::string& source) {
  if (source == "portaudio") {
#ifdef SEEDLING_WITH_PORTAUDIO
    return std::make_shared<seedling::audio::PortAudioSource>();
#else
    throw seedling::audio::AudioSourceError(
        "this build has no PortAudio support; use --audio stdin or a FIFO path");
#endif
  }
  return seedling::audio::PipeAudioSource::Open(source);
}

}  // namespace

int main(int argc, char* argv[]) {
  seedling::config::DaemonConfig config;
  try {
    config = seedling::config::LoadDaemonConfig(argc, argv, kPortAudioAvailable,
                                                  [](const char* name) -> const char* {
                                                    return std::getenv(name);
                                                  });
  } catch (const seedling::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n\n"
              << seedling::config::UsageText(argv[0]);
    return kExitConfigError;
  }

  if (config.show_help) {
    std::cout << seedling::config::UsageText(argv[0]);
    return 0;
  }

  for (const auto& w : config.warnings) {
    Logger::Warn("[seedlingd] " + w);
  }

  std::shared_ptr<seedling::audio::IAudioSource> audio;
  try {
    audio = MakeAudioSource(config.audio_source);
  } catch (const seedling::audio::AudioSourceError& e) {
    Logger::Error(std::string("[seedlingd] Audio source unavailable: ") + e.what());
    return kExitStartupError;
  }

  seedling::runtime::MainLoop loop;
  auto presentation = std::make_shared<seedling::runtime::LogPresentationSink>();
  seedling::runtime::RecordingOrchestrator orchestrator(
      loop, config.session, &seedling::session::MakeWebSocketChannel, audio, presentation,
      std::make_shared<seedling::SystemTimeSource>());

  seedling::control::ControlApiConfig api_config;
  api_config.port = config.port;
  seedling::control::ControlApi api(orchestrator, api_config);

  seedling::control::ControlServerConfig server_config;
  server_config.bind_address = config.bind_address;
  server_config.port = config.port;
  server_config.io_threads = config.http_threads;
  seedling::control::ControlServer server(api, server_config);
  try {
    server.Start();
  } catch (const std::runtime_error& e) {
    Logger::Error(std::string("[seedlingd] ") + e.what());
    return kExitStartupError;
  }

  boost::asio::signal_set signals(loop.context(), SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
    if (ec) return;
    Logger::Info("[seedlingd] Received signal " + std::to_string(signal_number) +
                 ", shutting down");
    orchestrator.Shutdown();
    loop.Shutdown();
  });

  Logger::Info("[seedlingd] Ready (audio=" + audio->Name() + ", asr=" + config.session.url + ")");
  if (!config.session.handshake.context_lines.empty()) {
    Logger::Info("[seedlingd] Dialog context: " +
                 std::to_string(config.session.handshake.context_lines.size()) + " line(s)");
  }
  loop.Run();

  server.Stop();
  audio->Stop();
  Logger::Info("[seedlingd] Exited");
  return 0;
}
