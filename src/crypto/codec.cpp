#include <algorithm>
#include <array>
#include <climits>
#include <cstring>
#include <sodium.h>
#include <zlib.h>

#include "crypto/codec.hpp"
#include "util/log.hpp"

namespace codec
{

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    if (!ok)
        LOG_ERROR("sodium_init failed");
    return ok;
}

std::uint32_t crc32(const std::uint8_t *data, std::size_t len)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths, feed in bounded slices
    while (len > 0)
    {
        const std::size_t take = std::min<std::size_t>(len, UINT_MAX);
        crc                    = ::crc32(crc, data, static_cast<uInt>(take));
        data += take;
        len -= take;
    }
    return static_cast<std::uint32_t>(crc);
}

std::string base64_encode(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    const std::size_t cap = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string       out(cap, '\0');
    sodium_bin2base64(out.data(), cap, data, len, sodium_base64_VARIANT_ORIGINAL);
    // cap counts the trailing NUL
    out.resize(std::strlen(out.c_str()));
    return out;
}

bool base64_decode(std::string_view in, std::vector<std::uint8_t> &out)
{
    ensure_sodium_init();
    out.assign(in.size() / 4 * 3 + 3, 0);
    std::size_t bin_len = 0;
    // b64_end == nullptr: the whole input must be valid, trailing garbage fails
    if (sodium_base642bin(out.data(), out.size(), in.data(), in.size(), /*ignore=*/nullptr,
                          &bin_len, /*b64_end=*/nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        out.clear();
        return false;
    }
    out.resize(bin_len);
    return true;
}

std::uint64_t random_u64()
{
    ensure_sodium_init();
    std::uint64_t v = 0;
    randombytes_buf(&v, sizeof v);
    return v;
}

std::string random_message_id()
{
    ensure_sodium_init();
    std::array<unsigned char, 8> id{};
    randombytes_buf(id.data(), id.size());
    char hex[2 * 8 + 1];
    sodium_bin2hex(hex, sizeof hex, id.data(), id.size());
    return std::string(hex);
}

}  // namespace codec
