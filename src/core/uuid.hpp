#pragma once

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace chatstore {

// UUID v4 generator for conversation and message ids.
// One engine per thread: ids are minted from the async I/O pool as well.
class UUID {
 public:
  static std::string generate() {
    thread_local std::mt19937_64 gen{seed()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(gen);
    uint64_t lo = dist(gen);

    // version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx", static_cast<unsigned long long>(hi >> 32),
                  static_cast<unsigned long long>((hi >> 16) & 0xFFFF), static_cast<unsigned long long>(hi & 0xFFFF),
                  static_cast<unsigned long long>(lo >> 48), static_cast<unsigned long long>(lo & 0x0000FFFFFFFFFFFFULL));
    return buf;
  }

 private:
  static uint64_t seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
  }
};

}  // namespace chatstore
