#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace codec
{

// Deterministic generator over libsodium's ChaCha20 keystream
// (randombytes_buf_deterministic). The same 64-bit seed gives the same
// sequence on every platform, which is what lets a sender replay any
// fountain symbol from (seed + seq) alone.
class DetRng
{
  public:
    explicit DetRng(std::uint64_t seed);

    std::uint64_t next_u64();
    // Uniform in [0, n); n must be > 0
    std::uint64_t uniform(std::uint64_t n);
    // Uniform in [0, 1)
    double unit();

  private:
    static constexpr std::size_t BLOCK_SIZE = 256;

    void refill();

    std::uint64_t                          seed_;
    std::uint64_t                          block_{0};
    std::array<std::uint8_t, BLOCK_SIZE>   buf_{};
    std::size_t                            pos_{BLOCK_SIZE};
};

}  // namespace codec
