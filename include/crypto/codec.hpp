#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codec
{

// libsodium must be initialised before any randomness is drawn; safe to call repeatedly
bool ensure_sodium_init();

// IEEE CRC32 (zlib polynomial), check value crc32("123456789") == 0xCBF43926
std::uint32_t crc32(const std::uint8_t *data, std::size_t len);
inline std::uint32_t crc32(const std::vector<std::uint8_t> &data)
{
    return crc32(data.data(), data.size());
}

// Standard alphabet, padded
std::string base64_encode(const std::uint8_t *data, std::size_t len);
inline std::string base64_encode(const std::vector<std::uint8_t> &data)
{
    return base64_encode(data.data(), data.size());
}
bool base64_decode(std::string_view in, std::vector<std::uint8_t> &out);

inline std::size_t base64_encoded_len(std::size_t bin_len)
{
    return ((bin_len + 2) / 3) * 4;
}

// Fresh 64-bit value from the system CSPRNG
std::uint64_t random_u64();
// 16 lowercase hex chars, used to tag one multi-part or fountain transfer
std::string random_message_id();

}  // namespace codec
