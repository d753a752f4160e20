#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// serverscore version
#define SERVERSCORE_VERSION_STRING "0.3.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef SERVERSCORE_PLATFORM_WINDOWS
        #define SERVERSCORE_PLATFORM_WINDOWS
    #endif
#endif

// Utility macros
#define SERVERSCORE_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

// Constants
namespace serverscore {
namespace constants {

// Report sanity limits
constexpr int64_t MIN_TPS_MILLIS = 10;
constexpr int64_t MAX_TPS_MILLIS = 25000;
constexpr int64_t MAX_PLAYERS_SANITY = 10000;
constexpr double MEMORY_TOTAL_TOLERANCE = 0.05;        // used + free vs. total
constexpr uint64_t MAX_UPTIME_MS = 100ULL * 365 * 24 * 60 * 60 * 1000; // 100 years

// Score scale
constexpr uint32_t MIN_SCORE = 0;
constexpr uint32_t DEFAULT_MAX_SCORE = 1000;
constexpr uint32_t EXCELLENT_SCORE_THRESHOLD = 850;
constexpr uint32_t GOOD_SCORE_THRESHOLD = 650;
constexpr uint32_t POOR_SCORE_THRESHOLD = 300;

// Cryptography constants
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;  // libsodium uses 64 bytes (32-byte seed + 32-byte public key)
constexpr size_t ED25519_SIGNATURE_SIZE = 64;
constexpr size_t SHA256_HASH_SIZE = 32;

// Milliseconds helpers
constexpr uint64_t MS_PER_SECOND = 1000;
constexpr uint64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr uint64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;

} // namespace constants
} // namespace serverscore

// Core types
namespace serverscore {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

// Cryptographic types
template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<constants::SHA256_HASH_SIZE>;
using PublicKey = fixed_bytes<constants::ED25519_PUBLIC_KEY_SIZE>;
using SecretKey = fixed_bytes<constants::ED25519_SECRET_KEY_SIZE>;
using Signature = fixed_bytes<constants::ED25519_SIGNATURE_SIZE>;

// Utility functions
std::string hash_to_hex(const Hash256& hash);
std::string bytes_to_hex(const byte* data, size_t len);
std::optional<bytes> hex_to_bytes(const std::string& hex);

// Base64 encoding/decoding
std::string base64_encode(const bytes& data);
std::string base64_encode(const void* data, size_t len);

// URL-safe alphabet ('-' and '_'), no padding on output, padding optional on input.
// nullopt on any character outside the alphabet other than trailing '='.
std::string base64url_encode(const bytes& data);
std::optional<bytes> base64url_decode(const std::string& encoded);

} // namespace serverscore
