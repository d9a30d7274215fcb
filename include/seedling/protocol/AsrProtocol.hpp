// Repository: Seedling
// Component: ASR Wire Protocol
// Purpose: Binary frame codec for the streaming recognition endpoint.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_PROTOCOL_ASR_PROTOCOL_HPP_
#define SEEDLING_PROTOCOL_ASR_PROTOCOL_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "seedling/util/Json.hpp"

namespace seedling::protocol {

// Frame layout (all integers big-endian):
//
//   byte 0   version(4) | header_words(4)
//   byte 1   message_type(4) | flags(4)
//   byte 2   serialization(4) | compression(4)
//   byte 3   reserved (0)
//   [int32   sequence]      when flags & kFlagPosSequence
//   [4 bytes event]         when flags & kFlagEvent (skipped, not surfaced)
//   [int32   error code]    SERVER_ERROR_RESPONSE only
//   uint32   payload size
//   payload                 gzip(JSON) or gzip(PCM)
//
// Client frames always use a single header word (4 bytes).

constexpr uint8_t kProtocolVersionV1 = 0b0001;
constexpr uint8_t kDefaultHeaderWords = 0b0001;

constexpr uint8_t kMessageTypeClientFullRequest = 0b0001;
constexpr uint8_t kMessageTypeClientAudioOnlyRequest = 0b0010;
constexpr uint8_t kMessageTypeServerFullResponse = 0b1001;
constexpr uint8_t kMessageTypeServerErrorResponse = 0b1111;

constexpr uint8_t kFlagNoSequence = 0b0000;
constexpr uint8_t kFlagPosSequence = 0b0001;
constexpr uint8_t kFlagNegSequence = 0b0010;
constexpr uint8_t kFlagNegWithSequence = 0b0011;
constexpr uint8_t kFlagEvent = 0b0100;

constexpr uint8_t kSerializationNone = 0b0000;
constexpr uint8_t kSerializationJson = 0b0001;

constexpr uint8_t kCompressionNone = 0b0000;
constexpr uint8_t kCompressionGzip = 0b0001;

// Thrown by ParseFrame when the input is too short for the header or for a
// fixed-width field the header announces.
class FrameFormatError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Session options carried by the first (full client request) frame.
struct HandshakeRequest {
  std::string user_id = "seedling_user";
  int sample_rate_hz = 16000;
  int bits_per_sample = 16;
  int channels = 1;
  std::string model_name = "bigmodel";
  bool enable_itn = true;         // inverse text normalization
  bool enable_punc = true;
  bool enable_ddc = true;         // disfluency removal
  bool show_utterances = true;
  bool enable_nonstream = true;   // second, higher-accuracy pass
  int end_window_size_ms = 3000;  // silence that triggers the second pass

  // Dialog context biasing recognition. Joined with spaces and sent as
  // request.corpus.context, a JSON string of
  // {"context_type":"dialog_ctx","context_data":[{"text":...}]}.
  // Omitted when empty.
  std::vector<std::string> context_lines;
};

// JSON body of the handshake, before compression.
std::string SerializeHandshakeRequest(const HandshakeRequest& request);

std::vector<uint8_t> BuildHandshakeFrame(int32_t sequence,
                                         const HandshakeRequest& request);

// is_final selects kFlagNegWithSequence and transmits -sequence.
std::vector<uint8_t> BuildAudioSegmentFrame(int32_t sequence,
                                            const uint8_t* pcm, size_t len,
                                            bool is_final);
std::vector<uint8_t> BuildAudioSegmentFrame(int32_t sequence,
                                            const std::vector<uint8_t>& pcm,
                                            bool is_final);

struct Frame {
  uint8_t version = 0;
  uint8_t header_words = 0;
  uint8_t message_type = 0;
  uint8_t flags = 0;
  uint8_t serialization = 0;
  uint8_t compression = 0;

  std::optional<int32_t> sequence;
  bool is_last = false;
  int32_t code = 0;            // non-zero only for error responses
  uint32_t payload_size = 0;   // as declared on the wire

  // Decompressed payload when compression succeeded, otherwise the raw bytes.
  std::vector<uint8_t> payload;
  bool decompress_failed = false;

  // Set only when serialization is JSON and the payload parsed.
  std::optional<util::JsonValue> message;
};

// Decodes one frame. Malformed payloads (bad gzip, bad JSON) degrade to a
// metadata-only frame; a truncated header or fixed field throws
// FrameFormatError.
Frame ParseFrame(const uint8_t* data, size_t len);
Frame ParseFrame(const std::vector<uint8_t>& bytes);

// message.result.text when present and non-empty.
std::optional<std::string> ExtractRecognizedText(const Frame& frame);

// One-line summary for debug logs, e.g.
// "type=0x9 flags=0x3 seq=-4 last=1 code=0 payload=118B json=1".
std::string DescribeFrame(const Frame& frame);

}  // namespace seedling::protocol

#endif  // SEEDLING_PROTOCOL_ASR_PROTOCOL_HPP_
