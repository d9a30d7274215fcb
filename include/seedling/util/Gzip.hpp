// Repository: Seedling
// Component: Gzip helpers
// Purpose: zlib-backed gzip member encode/decode for protocol payloads.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_UTIL_GZIP_HPP_
#define SEEDLING_UTIL_GZIP_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

namespace seedling::util {

class GzipError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Produces a single gzip member (RFC 1952 header + deflate + CRC32/ISIZE).
// An empty input still yields a valid member. Throws GzipError only when zlib
// itself fails (out of memory); input can never make it fail.
std::vector<uint8_t> GzipCompress(const uint8_t* data, size_t len);
std::vector<uint8_t> GzipCompress(const std::vector<uint8_t>& data);

// Inflates a gzip member. Returns nullopt for anything that is not a complete,
// checksum-valid gzip stream (truncated, corrupt, wrong magic).
std::optional<std::vector<uint8_t>> GzipDecompress(const uint8_t* data, size_t len);
std::optional<std::vector<uint8_t>> GzipDecompress(const std::vector<uint8_t>& data);

}  // namespace seedling::util

#endif  // SEEDLING_UTIL_GZIP_HPP_
