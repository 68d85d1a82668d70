#include <sodium.h>

#include "crypto/codec.hpp"
#include "crypto/det_rng.hpp"

namespace codec
{

static_assert(randombytes_SEEDBYTES == 32, "unexpected libsodium seed size");

static void put_le64(std::uint8_t *out, std::uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        out[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

DetRng::DetRng(std::uint64_t seed) : seed_(seed) {}

void DetRng::refill()
{
    ensure_sodium_init();
    // key = [seed LE (8B)][block counter LE (8B)][zero (16B)]
    std::array<unsigned char, randombytes_SEEDBYTES> key{};
    put_le64(key.data(), seed_);
    put_le64(key.data() + 8, block_);
    randombytes_buf_deterministic(buf_.data(), buf_.size(), key.data());
    sodium_memzero(key.data(), key.size());
    ++block_;
    pos_ = 0;
}

std::uint64_t DetRng::next_u64()
{
    if (pos_ + 8 > buf_.size())
        refill();
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<std::uint64_t>(buf_[pos_ + i]) << (8 * i);
    pos_ += 8;
    return v;
}

std::uint64_t DetRng::uniform(std::uint64_t n)
{
    if (n <= 1)
        return 0;
    // rejection sampling keeps every residue equally likely
    const std::uint64_t limit = UINT64_MAX - (UINT64_MAX % n);
    std::uint64_t       v;
    do
    {
        v = next_u64();
    } while (v >= limit);
    return v % n;
}

double DetRng::unit()
{
    // top 53 bits -> [0, 1)
    return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
}

}  // namespace codec
