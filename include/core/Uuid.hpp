#pragma once
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

// Random (version 4) UUID in canonical upper-case form, as the audio
// hardware layer expects for tap and aggregate device UIDs.
inline std::string makeUuid() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    uint64_t hi = generator();
    uint64_t lo = generator();

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08X-%04X-%04X-%04X-%012llX",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}
