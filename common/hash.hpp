#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for device fingerprints
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <cstdio>
#include <string>

#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

// Number of hex digits kept from the 64-bit digest
static constexpr size_t FINGERPRINT_DIGITS = 12;

inline u64 xxh3_64(const void* data, size_t len) {
    return (u64)XXH3_64bits(data, len);
}

inline std::string to_hex(u64 v, size_t digits = 16) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)v);
    return std::string(buf, digits > 16 ? 16 : digits);
}

// Short stable identifier for a device serial, usable as an alias key
inline std::string fingerprint(const std::string& serial) {
    return to_hex(xxh3_64(serial.data(), serial.size()), FINGERPRINT_DIGITS);
}

} // namespace hash
