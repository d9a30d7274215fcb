// Repository: Seedling
// Component: Gzip helpers
// Purpose: zlib-backed gzip member encode/decode for protocol payloads.
// Copyright (c) 2025 RetroVue

#include "seedling/util/Gzip.hpp"

#include <cstring>
#include <string>

#include <zlib.h>

namespace seedling::util {

namespace {

// windowBits 15 + 16 selects the gzip wrapper instead of zlib's.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;
constexpr size_t kInflateChunk = 16 * 1024;

}  // namespace

std::vector<uint8_t> GzipCompress(const uint8_t* data, size_t len) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  int rc = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                        kMemLevel, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw GzipError("deflateInit2 failed (rc=" + std::to_string(rc) + ")");
  }

  std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(len)));
  zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  zs.avail_in = static_cast<uInt>(len);
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());

  rc = deflate(&zs, Z_FINISH);
  const size_t produced = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    throw GzipError("deflate did not finish (rc=" + std::to_string(rc) + ")");
  }
  out.resize(produced);
  return out;
}

std::vector<uint8_t> GzipCompress(const std::vector<uint8_t>& data) {
  return GzipCompress(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> GzipDecompress(const uint8_t* data, size_t len) {
  if (data == nullptr || len == 0) return std::nullopt;

  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  if (inflateInit2(&zs, kGzipWindowBits) != Z_OK) {
    return std::nullopt;
  }

  zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  zs.avail_in = static_cast<uInt>(len);

  std::vector<uint8_t> out;
  int rc = Z_OK;
  while (rc == Z_OK) {
    const size_t offset = out.size();
    out.resize(offset + kInflateChunk);
    zs.next_out = reinterpret_cast<Bytef*>(out.data() + offset);
    zs.avail_out = static_cast<uInt>(kInflateChunk);
    rc = inflate(&zs, Z_NO_FLUSH);
    out.resize(offset + (kInflateChunk - zs.avail_out));
    if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
      // Input exhausted before the end of the member: truncated stream.
      break;
    }
  }
  inflateEnd(&zs);

  if (rc != Z_STREAM_END) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<uint8_t>> GzipDecompress(const std::vector<uint8_t>& data) {
  return GzipDecompress(data.data(), data.size());
}

}  // namespace seedling::util
