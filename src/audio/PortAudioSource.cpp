// Repository: Seedling
// Component: PortAudio Microphone Source
// Purpose: Captures the default input device as 16 kHz mono s16 PCM.
// Copyright (c) 2025 RetroVue

#include "seedling/audio/PortAudioSource.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <portaudio.h>

#include "seedling/util/Logger.hpp"

namespace seedling::audio {

using util::Logger;

namespace {

void PaCheck(PaError e, const char* what) {
  if (e != paNoError) {
    throw AudioSourceError(std::string(what) + " (" + std::to_string(static_cast<int>(e)) +
                           "): " + Pa_GetErrorText(e));
  }
}

}  // namespace

PortAudioSource::PortAudioSource() {
  PaCheck(Pa_Initialize(), "Pa_Initialize");
}

PortAudioSource::~PortAudioSource() {
  Stop();
  Pa_Terminate();
}

void PortAudioSource::Start(AudioChunkCallback on_chunk) {
  if (stream_ != nullptr) {
    throw AudioSourceError("capture already running");
  }

  PaStreamParameters in_params{};
  in_params.device = Pa_GetDefaultInputDevice();
  if (in_params.device == paNoDevice) {
    throw AudioSourceError("no default input device");
  }
  const PaDeviceInfo* info = Pa_GetDeviceInfo(in_params.device);
  in_params.channelCount = 1;
  in_params.sampleFormat = paInt16;
  in_params.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
  in_params.hostApiSpecificStreamInfo = nullptr;

  PaStream* stream = nullptr;
  PaCheck(Pa_OpenStream(&stream, &in_params, nullptr, kSampleRateHz,
                        kFramesPerBuffer, paNoFlag, nullptr, nullptr),
          "Pa_OpenStream");
  const PaError start_err = Pa_StartStream(stream);
  if (start_err != paNoError) {
    Pa_CloseStream(stream);
    PaCheck(start_err, "Pa_StartStream");
  }
  stream_ = stream;

  Logger::Info("[PortAudioSource] Capture started on '" +
               std::string(info ? info->name : "(unknown)") + "'");
  capture_stop_.store(false, std::memory_order_release);
  capture_thread_ = std::thread(&PortAudioSource::CaptureLoop, this, std::move(on_chunk));
}

void PortAudioSource::Stop() {
  capture_stop_.store(true, std::memory_order_release);
  if (capture_thread_.joinable()) {
    capture_thread_.join();
  }
  if (stream_ != nullptr) {
    auto* stream = static_cast<PaStream*>(stream_);
    Pa_StopStream(stream);
    Pa_CloseStream(stream);
    stream_ = nullptr;
    Logger::Info("[PortAudioSource] Capture stopped");
  }
}

void PortAudioSource::CaptureLoop(AudioChunkCallback on_chunk) {
  auto* stream = static_cast<PaStream*>(stream_);
  std::vector<int16_t> buf(kFramesPerBuffer);
  while (!capture_stop_.load(std::memory_order_acquire)) {
    const PaError e = Pa_ReadStream(stream, buf.data(), kFramesPerBuffer);
    if (e == paInputOverflowed) {
      Logger::Debug("[PortAudioSource] input overflowed");
      continue;
    }
    if (e != paNoError) {
      Logger::Error(std::string("[PortAudioSource] Pa_ReadStream failed: ") + Pa_GetErrorText(e));
      break;
    }
    on_chunk(reinterpret_cast<const uint8_t*>(buf.data()), buf.size() * sizeof(int16_t));
  }
}

}  // namespace seedling::audio
