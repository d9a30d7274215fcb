// Repository: Seedling
// Component: UUID generator
// Purpose: Random (version 4) identifiers for per-connection request ids.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_UTIL_UUID_HPP_
#define SEEDLING_UTIL_UUID_HPP_

#include <string>

namespace seedling::util {

// Returns a lowercase RFC 4122 version-4 UUID, e.g.
// "3f2b8c1e-9a4d-4e7f-b1c2-0d9e8f7a6b5c".
std::string GenerateUuidV4();

}  // namespace seedling::util

#endif  // SEEDLING_UTIL_UUID_HPP_
