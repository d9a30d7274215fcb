// Repository: Seedling
// Component: ASR Wire Protocol
// Purpose: Binary frame codec for the streaming recognition endpoint.
// Copyright (c) 2025 RetroVue

#include "seedling/protocol/AsrProtocol.hpp"

#include <sstream>
#include <string_view>

#include "seedling/util/Gzip.hpp"

namespace seedling::protocol {

namespace {

void AppendHeader(std::vector<uint8_t>& out, uint8_t message_type, uint8_t flags) {
  out.push_back(static_cast<uint8_t>((kProtocolVersionV1 << 4) | kDefaultHeaderWords));
  out.push_back(static_cast<uint8_t>((message_type << 4) | flags));
  out.push_back(static_cast<uint8_t>((kSerializationJson << 4) | kCompressionGzip));
  out.push_back(0x00);
}

void AppendBigEndian32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

std::vector<uint8_t> BuildFrame(uint8_t message_type, uint8_t flags,
                                int32_t wire_sequence,
                                const std::vector<uint8_t>& compressed) {
  std::vector<uint8_t> out;
  out.reserve(12 + compressed.size());
  AppendHeader(out, message_type, flags);
  AppendBigEndian32(out, static_cast<uint32_t>(wire_sequence));
  AppendBigEndian32(out, static_cast<uint32_t>(compressed.size()));
  out.insert(out.end(), compressed.begin(), compressed.end());
  return out;
}

// Bounds-checked big-endian reader over the frame body.
class Reader {
 public:
  Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

  void Skip(size_t n, const char* what) {
    Require(n, what);
    pos_ += n;
  }

  uint32_t ReadU32(const char* what) {
    Require(4, what);
    const uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                       (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                       (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                       static_cast<uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    return v;
  }

  int32_t ReadI32(const char* what) {
    return static_cast<int32_t>(ReadU32(what));
  }

  std::vector<uint8_t> Rest() const {
    return std::vector<uint8_t>(data_ + pos_, data_ + len_);
  }

 private:
  void Require(size_t n, const char* what) const {
    if (len_ - pos_ < n) {
      std::ostringstream msg;
      msg << "frame truncated reading " << what << " (need " << n
          << " bytes at offset " << pos_ << ", have " << (len_ - pos_) << ")";
      throw FrameFormatError(msg.str());
    }
  }

  const uint8_t* data_;
  size_t len_;
  size_t pos_ = 0;
};

bool CarriesPayloadSize(uint8_t message_type) {
  return message_type == kMessageTypeServerFullResponse ||
         message_type == kMessageTypeClientFullRequest ||
         message_type == kMessageTypeClientAudioOnlyRequest;
}

}  // namespace

std::string SerializeHandshakeRequest(const HandshakeRequest& request) {
  using util::JsonObjectWriter;
  JsonObjectWriter user;
  user.AddString("uid", request.user_id);

  JsonObjectWriter audio;
  audio.AddString("format", "pcm")
      .AddString("codec", "raw")
      .AddInt("rate", request.sample_rate_hz)
      .AddInt("bits", request.bits_per_sample)
      .AddInt("channel", request.channels);

  JsonObjectWriter options;
  options.AddString("model_name", request.model_name)
      .AddBool("enable_itn", request.enable_itn)
      .AddBool("enable_punc", request.enable_punc)
      .AddBool("enable_ddc", request.enable_ddc)
      .AddBool("show_utterances", request.show_utterances)
      .AddBool("enable_nonstream", request.enable_nonstream)
      .AddInt("end_window_size", request.end_window_size_ms);

  if (!request.context_lines.empty()) {
    std::string joined;
    for (const auto& line : request.context_lines) {
      if (!joined.empty()) joined += ' ';
      joined += line;
    }
    JsonObjectWriter item;
    item.AddString("text", joined);
    JsonObjectWriter context;
    context.AddString("context_type", "dialog_ctx")
        .AddRaw("context_data", "[" + item.str() + "]");
    // The recognizer expects the context object serialized into a string.
    JsonObjectWriter corpus;
    corpus.AddString("context", context.str());
    options.AddRaw("corpus", corpus.str());
  }

  JsonObjectWriter root;
  root.AddRaw("user", user.str())
      .AddRaw("audio", audio.str())
      .AddRaw("request", options.str());
  return root.str();
}

std::vector<uint8_t> BuildHandshakeFrame(int32_t sequence,
                                         const HandshakeRequest& request) {
  const std::string json = SerializeHandshakeRequest(request);
  const auto compressed = util::GzipCompress(
      reinterpret_cast<const uint8_t*>(json.data()), json.size());
  return BuildFrame(kMessageTypeClientFullRequest, kFlagPosSequence, sequence,
                    compressed);
}

std::vector<uint8_t> BuildAudioSegmentFrame(int32_t sequence,
                                            const uint8_t* pcm, size_t len,
                                            bool is_final) {
  const auto compressed = util::GzipCompress(pcm, len);
  if (is_final) {
    return BuildFrame(kMessageTypeClientAudioOnlyRequest, kFlagNegWithSequence,
                      -sequence, compressed);
  }
  return BuildFrame(kMessageTypeClientAudioOnlyRequest, kFlagPosSequence,
                    sequence, compressed);
}

std::vector<uint8_t> BuildAudioSegmentFrame(int32_t sequence,
                                            const std::vector<uint8_t>& pcm,
                                            bool is_final) {
  return BuildAudioSegmentFrame(sequence, pcm.data(), pcm.size(), is_final);
}

Frame ParseFrame(const uint8_t* data, size_t len) {
  if (data == nullptr || len < 4) {
    throw FrameFormatError("frame shorter than the 4-byte fixed header");
  }

  Frame frame;
  frame.version = static_cast<uint8_t>(data[0] >> 4);
  frame.header_words = static_cast<uint8_t>(data[0] & 0x0F);
  frame.message_type = static_cast<uint8_t>(data[1] >> 4);
  frame.flags = static_cast<uint8_t>(data[1] & 0x0F);
  frame.serialization = static_cast<uint8_t>(data[2] >> 4);
  frame.compression = static_cast<uint8_t>(data[2] & 0x0F);

  Reader reader(data, len);
  reader.Skip(static_cast<size_t>(frame.header_words) * 4, "header");

  if (frame.flags & kFlagPosSequence) {
    frame.sequence = reader.ReadI32("sequence");
  }
  if (frame.flags & kFlagNegSequence) {
    frame.is_last = true;
  }
  if (frame.flags & kFlagEvent) {
    reader.Skip(4, "event field");
  }

  if (frame.message_type == kMessageTypeServerErrorResponse) {
    frame.code = reader.ReadI32("error code");
    frame.payload_size = reader.ReadU32("payload size");
  } else if (CarriesPayloadSize(frame.message_type)) {
    frame.payload_size = reader.ReadU32("payload size");
  }
  frame.payload = reader.Rest();

  if (frame.payload.empty()) {
    return frame;
  }
  if (frame.compression == kCompressionGzip) {
    auto inflated = util::GzipDecompress(frame.payload);
    if (!inflated) {
      frame.decompress_failed = true;
      return frame;
    }
    frame.payload = std::move(*inflated);
  }
  if (frame.serialization == kSerializationJson) {
    frame.message = util::ParseJson(std::string_view(
        reinterpret_cast<const char*>(frame.payload.data()), frame.payload.size()));
  }
  return frame;
}

Frame ParseFrame(const std::vector<uint8_t>& bytes) {
  return ParseFrame(bytes.data(), bytes.size());
}

std::optional<std::string> ExtractRecognizedText(const Frame& frame) {
  if (!frame.message) return std::nullopt;
  const util::JsonValue* result = frame.message->Find("result");
  if (result == nullptr) return std::nullopt;
  auto text = result->GetString("text");
  if (!text || text->empty()) return std::nullopt;
  return text;
}

std::string DescribeFrame(const Frame& frame) {
  std::ostringstream o;
  o << "type=0x" << std::hex << static_cast<int>(frame.message_type)
    << " flags=0x" << static_cast<int>(frame.flags) << std::dec;
  if (frame.sequence) {
    o << " seq=" << *frame.sequence;
  }
  o << " last=" << (frame.is_last ? 1 : 0)
    << " code=" << frame.code
    << " payload=" << frame.payload.size() << "B"
    << " json=" << (frame.message ? 1 : 0);
  if (frame.decompress_failed) {
    o << " gzip=bad";
  }
  return o.str();
}

}  // namespace seedling::protocol
