#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "crypto/det_rng.hpp"
#include "proto/errors.hpp"

/*
TX:
Encoder::create(message, fragment_size)
  -> split(message)                // K zero-padded fragments
     -> next_part(seq)             // DetRng(seed + seq)
          -> sample_degree()       // d in 1..10, clipped to K
          -> choose_fragments()    // d distinct indexes, sorted
          -> XOR of those fragments = Part{indexes, data}

RX:
Decoder(K, message_len)
  -> receive_part(Part)
       -> simplify against recovered fragments
          -> 0 unknowns: redundant
          -> 1 unknown : recover + peel through pending parts (work-list)
          -> 2+        : queue in pending
  -> result() once every fragment is recovered, truncated to message_len
*/

namespace fountain
{

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t MAX_DEGREE = 10;

struct Part
{
    std::vector<std::size_t> indexes;  // sorted, distinct, 0..K-1
    Bytes                    data;     // XOR of the fragments named by indexes
};

struct DecoderStats
{
    std::size_t fragment_count  = 0;
    std::size_t recovered_count = 0;
    std::size_t pending_parts   = 0;
    bool        is_complete     = false;
    float       progress        = 0.0f;
};

// target ^= source over the common prefix
void xor_into(Bytes &target, const Bytes &source);

// Zero-padded fragments of fragment_size bytes each; empty for fragment_size == 0
std::vector<Bytes> split(const Bytes &message, std::size_t fragment_size);

// P(1)=0.5, P(2)=0.3, P(3)=0.15, P(4..10)=0.05 uniform, clipped to k. Returns 0 for k == 0.
std::size_t sample_degree(codec::DetRng &rng, std::size_t k);

// sample_degree() distinct indexes from 0..k-1, sorted ascending
std::vector<std::size_t> choose_fragments(codec::DetRng &rng, std::size_t k);

class Encoder
{
  public:
    // nullopt for an empty message or fragment_size == 0
    static std::optional<Encoder> create(const Bytes &message, std::size_t fragment_size);
    static std::optional<Encoder> create(const Bytes  &message,
                                         std::size_t   fragment_size,
                                         std::uint64_t seed);

    // Same seq always yields the same part
    Part next_part(std::size_t seq) const;

    std::size_t   fragment_count() const { return fragments_.size(); }
    std::size_t   fragment_size() const { return fragment_size_; }
    std::size_t   message_len() const { return message_len_; }
    std::uint64_t seed() const { return seed_; }

  private:
    Encoder(std::vector<Bytes> fragments,
            std::size_t        fragment_size,
            std::size_t        message_len,
            std::uint64_t      seed);

    std::vector<Bytes> fragments_;
    std::size_t        fragment_size_{0};
    std::size_t        message_len_{0};
    std::uint64_t      seed_{0};
};

class Decoder
{
  public:
    Decoder(std::size_t fragment_count, std::size_t message_len);

    // InvalidData if the part does not fit this message; state is left untouched then
    qr::Errc receive_part(Part part);

    bool  is_complete() const { return complete_; }
    bool  can_decode() const { return recovered_count_ == fragment_count_ && fragment_count_ > 0; }
    float progress() const;

    qr::Errc     result(Bytes &out) const;
    DecoderStats stats() const;

    std::size_t fragment_count() const { return fragment_count_; }
    std::size_t fragment_size() const { return fragment_size_; }  // 0 until the first part
    std::size_t message_len() const { return message_len_; }
    std::size_t recovered_count() const { return recovered_count_; }
    std::size_t pending_count() const { return pending_.size(); }
    bool        has_fragment(std::size_t idx) const
    {
        return idx < recovered_.size() && recovered_[idx].has_value();
    }

  private:
    bool validate(Part &part) const;
    void simplify(Part &part) const;
    void recover(std::size_t idx, Bytes data);

    std::size_t                       fragment_count_{0};
    std::size_t                       fragment_size_{0};
    std::size_t                       message_len_{0};
    std::size_t                       recovered_count_{0};
    std::vector<std::optional<Bytes>> recovered_;
    std::vector<Part>                 pending_;
    bool                              complete_{false};
};

}  // namespace fountain
