#include <algorithm>
#include <cstring>
#include <deque>
#include <numeric>

#include "crypto/codec.hpp"
#include "proto/fountain.hpp"
#include "util/log.hpp"

namespace fountain
{

void xor_into(Bytes &target, const Bytes &source)
{
    const std::size_t n = std::min(target.size(), source.size());
    for (std::size_t i = 0; i < n; ++i)
        target[i] ^= source[i];
}

std::vector<Bytes> split(const Bytes &message, std::size_t fragment_size)
{
    if (fragment_size == 0)
        return {};
    const std::size_t  count = (message.size() + fragment_size - 1) / fragment_size;
    std::vector<Bytes> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const std::size_t start = i * fragment_size;
        const std::size_t take  = std::min(fragment_size, message.size() - start);
        Bytes             frag(fragment_size, 0);  // tail stays zero
        std::memcpy(frag.data(), message.data() + start, take);
        out.push_back(std::move(frag));
    }
    return out;
}

std::size_t sample_degree(codec::DetRng &rng, std::size_t k)
{
    if (k == 0)
    {
        LOG_ERROR("sample_degree: no fragments to choose from");
        return 0;
    }
    const double r = rng.unit();
    std::size_t  d;
    if (r < 0.5)
        d = 1;
    else if (r < 0.8)
        d = 2;
    else if (r < 0.95)
        d = 3;
    else
        d = 4 + static_cast<std::size_t>(rng.uniform(MAX_DEGREE - 4 + 1));
    return std::min(d, k);
}

std::vector<std::size_t> choose_fragments(codec::DetRng &rng, std::size_t k)
{
    const std::size_t degree = sample_degree(rng, k);

    // draw without replacement from the remaining pool
    std::vector<std::size_t> pool(k);
    std::iota(pool.begin(), pool.end(), std::size_t{0});
    std::vector<std::size_t> chosen;
    chosen.reserve(degree);
    for (std::size_t i = 0; i < degree; ++i)
    {
        const std::size_t pick = static_cast<std::size_t>(rng.uniform(pool.size()));
        chosen.push_back(pool[pick]);
        pool[pick] = pool.back();
        pool.pop_back();
    }
    std::sort(chosen.begin(), chosen.end());
    return chosen;
}

// ---------------------------------------------------------------------------
// Encoder
// ---------------------------------------------------------------------------

Encoder::Encoder(std::vector<Bytes> fragments,
                 std::size_t        fragment_size,
                 std::size_t        message_len,
                 std::uint64_t      seed)
    : fragments_(std::move(fragments)),
      fragment_size_(fragment_size),
      message_len_(message_len),
      seed_(seed)
{
}

std::optional<Encoder> Encoder::create(const Bytes &message, std::size_t fragment_size)
{
    return create(message, fragment_size, codec::random_u64());
}

std::optional<Encoder> Encoder::create(const Bytes  &message,
                                       std::size_t   fragment_size,
                                       std::uint64_t seed)
{
    if (fragment_size == 0)
    {
        LOG_ERROR("Encoder::create: fragment_size must be >= 1");
        return std::nullopt;
    }
    if (message.empty())
    {
        LOG_ERROR("Encoder::create: empty message");
        return std::nullopt;
    }
    auto fragments = split(message, fragment_size);
    LOG_DEBUG("Encoder::create: %zu bytes -> %zu fragments of %zu", message.size(),
              fragments.size(), fragment_size);
    return Encoder{std::move(fragments), fragment_size, message.size(), seed};
}

Part Encoder::next_part(std::size_t seq) const
{
    // wrapping add, seq alone identifies the symbol
    codec::DetRng rng(seed_ + static_cast<std::uint64_t>(seq));

    Part p;
    p.indexes = choose_fragments(rng, fragments_.size());
    p.data.assign(fragment_size_, 0);
    for (std::size_t idx : p.indexes)
        xor_into(p.data, fragments_[idx]);
    return p;
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

Decoder::Decoder(std::size_t fragment_count, std::size_t message_len)
    : fragment_count_(fragment_count), message_len_(message_len), recovered_(fragment_count)
{
}

float Decoder::progress() const
{
    if (fragment_count_ == 0)
        return 0.0f;
    return static_cast<float>(recovered_count_) / static_cast<float>(fragment_count_);
}

bool Decoder::validate(Part &part) const
{
    if (part.indexes.empty())
    {
        LOG_WARN("Decoder: part without indexes");
        return false;
    }
    std::sort(part.indexes.begin(), part.indexes.end());
    if (std::adjacent_find(part.indexes.begin(), part.indexes.end()) != part.indexes.end())
    {
        LOG_WARN("Decoder: duplicate index in part");
        return false;
    }
    if (part.indexes.back() >= fragment_count_)
    {
        LOG_WARN("Decoder: index %zu out of range (K=%zu)", part.indexes.back(),
                 fragment_count_);
        return false;
    }

    const std::size_t fsize = fragment_size_ ? fragment_size_ : part.data.size();
    if (part.data.size() != fsize)
    {
        LOG_WARN("Decoder: part size %zu, expected %zu", part.data.size(), fsize);
        return false;
    }
    // K must be exactly ceil(message_len / fragment_size)
    if (fsize == 0 || fsize * fragment_count_ < message_len_ ||
        fsize * (fragment_count_ - 1) >= message_len_)
    {
        LOG_WARN("Decoder: fragment size %zu inconsistent with K=%zu, message_len=%zu", fsize,
                 fragment_count_, message_len_);
        return false;
    }
    return true;
}

void Decoder::simplify(Part &part) const
{
    std::vector<std::size_t> unknown;
    unknown.reserve(part.indexes.size());
    for (std::size_t idx : part.indexes)
    {
        if (recovered_[idx])
            xor_into(part.data, *recovered_[idx]);
        else
            unknown.push_back(idx);
    }
    part.indexes = std::move(unknown);
}

void Decoder::recover(std::size_t idx, Bytes data)
{
    std::deque<std::size_t> work;
    recovered_[idx] = std::move(data);
    ++recovered_count_;
    work.push_back(idx);

    while (!work.empty())
    {
        const std::size_t known = work.front();
        work.pop_front();
        const Bytes &frag = *recovered_[known];

        std::size_t i = 0;
        while (i < pending_.size())
        {
            Part &p  = pending_[i];
            auto  it = std::lower_bound(p.indexes.begin(), p.indexes.end(), known);
            if (it == p.indexes.end() || *it != known)
            {
                ++i;
                continue;
            }
            xor_into(p.data, frag);
            p.indexes.erase(it);
            if (p.indexes.size() > 1)
            {
                ++i;
                continue;
            }
            if (p.indexes.size() == 1)
            {
                const std::size_t next = p.indexes.front();
                // already known but not yet peeled: this equation is redundant
                if (!recovered_[next])
                {
                    recovered_[next] = std::move(p.data);
                    ++recovered_count_;
                    work.push_back(next);
                }
            }
            // resolved or redundant, drop it (order of pending_ is irrelevant)
            if (i + 1 != pending_.size())
                pending_[i] = std::move(pending_.back());
            pending_.pop_back();
        }
    }
}

qr::Errc Decoder::receive_part(Part part)
{
    if (complete_)
        return qr::Errc::Ok;
    if (!validate(part))
        return qr::Errc::InvalidData;
    if (fragment_size_ == 0)
        fragment_size_ = part.data.size();

    simplify(part);

    if (part.indexes.empty())
    {
        LOG_DEBUG("Decoder: redundant part");
        return qr::Errc::Ok;
    }
    if (part.indexes.size() == 1)
    {
        recover(part.indexes.front(), std::move(part.data));
    }
    else
    {
        const bool dup = std::any_of(pending_.begin(), pending_.end(),
                                     [&](const Part &q) { return q.indexes == part.indexes; });
        if (!dup)
            pending_.push_back(std::move(part));
    }

    if (recovered_count_ == fragment_count_)
    {
        complete_ = true;
        pending_.clear();
        LOG_DEBUG("Decoder: all %zu fragments recovered", fragment_count_);
    }
    return qr::Errc::Ok;
}

qr::Errc Decoder::result(Bytes &out) const
{
    if (!complete_)
        return qr::Errc::DecodingIncomplete;

    out.clear();
    out.reserve(fragment_count_ * fragment_size_);
    for (const auto &frag : recovered_)
    {
        if (!frag)
            return qr::Errc::DecodingIncomplete;  // should not happen
        out.insert(out.end(), frag->begin(), frag->end());
    }
    out.resize(message_len_);  // strip the zero padding
    return qr::Errc::Ok;
}

DecoderStats Decoder::stats() const
{
    DecoderStats s;
    s.fragment_count  = fragment_count_;
    s.recovered_count = recovered_count_;
    s.pending_parts   = pending_.size();
    s.is_complete     = complete_;
    s.progress        = progress();
    return s;
}

}  // namespace fountain
