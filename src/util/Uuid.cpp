// Repository: Seedling
// Component: UUID generator
// Purpose: Random (version 4) identifiers for per-connection request ids.
// Copyright (c) 2025 RetroVue

#include "seedling/util/Uuid.hpp"

#include <random>

namespace seedling::util {

std::string GenerateUuidV4() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';                              // version nibble
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];    // variant 10xx
    else out += hexdig[dis(gen)];
  }
  return out;
}

}  // namespace seedling::util
