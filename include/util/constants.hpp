#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>

#include "util/log.hpp"

namespace constants
{
// Byte capacity of one QR symbol (version 40, binary mode) per error correction level
inline constexpr std::size_t MAX_QR_BYTES_L = 2953;
inline constexpr std::size_t MAX_QR_BYTES_M = 2331;
inline constexpr std::size_t MAX_QR_BYTES_Q = 1663;
inline constexpr std::size_t MAX_QR_BYTES_H = 1273;

// Room left in a single frame for the JSON envelope around the base64 data
inline constexpr std::size_t FRAME_HEADER_RESERVE = 50;

inline constexpr std::size_t RECOMMENDED_FRAGMENT_SIZE = 100;
inline constexpr std::size_t DEFAULT_REDUNDANCY_FRAMES = 10;
// Upper bound accepted from env/CLI; a fragment must still fit one QR symbol
inline constexpr std::size_t MAX_FRAGMENT_SIZE = 2048;
// Receiver refuses fountain headers announcing more fragments than this
inline constexpr std::size_t MAX_FOUNTAIN_FRAGMENTS = 1u << 16;

inline constexpr const char *DEFAULT_CONTENT_TYPE = "application/octet-stream";

// Parse a positive size from the environment. Falls back to defv when unset or invalid.
[[maybe_unused]] static std::size_t env_size(const char *key, std::size_t defv, std::size_t maxv)
{
    const char *v = std::getenv(key);
    if (!v || !*v)
        return defv;
    char              *end = nullptr;
    unsigned long long n   = std::strtoull(v, &end, 10);
    if (end == v || *end != '\0' || n > maxv)
    {
        LOG_WARN("ignoring %s=%s (expected integer <= %zu)", key, v, maxv);
        return defv;
    }
    return static_cast<std::size_t>(n);
}

[[maybe_unused]] static std::size_t fragment_size()
{
    std::size_t n =
        env_size("QRSTREAM_FRAGMENT_SIZE", RECOMMENDED_FRAGMENT_SIZE, MAX_FRAGMENT_SIZE);
    if (n == 0)
    {
        LOG_WARN("QRSTREAM_FRAGMENT_SIZE must be >= 1, using %zu", RECOMMENDED_FRAGMENT_SIZE);
        return RECOMMENDED_FRAGMENT_SIZE;
    }
    return n;
}

[[maybe_unused]] static std::size_t redundancy_frames()
{
    return env_size("QRSTREAM_REDUNDANCY", DEFAULT_REDUNDANCY_FRAMES, 1u << 16);
}

}  // namespace constants
