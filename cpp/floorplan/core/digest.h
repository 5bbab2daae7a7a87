#pragma once

#include "floorplan/core/types.h"

#include <cstdint>
#include <cstring>
#include <cmath>
#include <vector>

namespace floorplan {

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashU64(std::uint64_t h, std::uint64_t v) {
    h = hashU32(h, static_cast<std::uint32_t>(v & 0xffffffffu));
    return hashU32(h, static_cast<std::uint32_t>(v >> 32));
}

inline std::uint64_t canonicalizeF64(double v) {
    if (std::isnan(v)) return 0x7ff8000000000000ull;
    if (v == 0.0) return 0u;
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF64(std::uint64_t h, double v) {
    return hashU64(h, canonicalizeF64(v));
}

std::uint64_t wallDigest(const WallRec& wall);

// Order-independent: per-wall digests are sorted before being folded together.
std::uint64_t networkDigest(const std::vector<WallRec>& walls);

} // namespace floorplan
