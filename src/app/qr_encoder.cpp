#include <algorithm>
#include <cstdint>
#include <limits>

#include "app/qr_encoder.hpp"
#include "crypto/codec.hpp"
#include "proto/frame.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace qr
{

static bool fits_u32(std::size_t n)
{
    return n <= std::numeric_limits<std::uint32_t>::max();
}

Errc QrEncoder::encode(const std::vector<std::uint8_t> &data,
                       ContentType                      type,
                       std::vector<std::string>        &frames) const
{
    const std::size_t cap = max_bytes(opts_.error_correction) - constants::FRAME_HEADER_RESERVE;
    if (codec::base64_encoded_len(data.size()) <= cap)
        return encode_single(data, type, frames);
    return encode_multipart(data, type, frames);
}

Errc QrEncoder::encode_single(const std::vector<std::uint8_t> &data,
                              ContentType                      type,
                              std::vector<std::string>        &frames) const
{
    frame::Single f;
    f.content_type = content_type_str(type);
    f.data         = codec::base64_encode(data);
    f.checksum     = codec::crc32(data);

    frames.clear();
    frames.push_back(frame::serialize(f));
    return Errc::Ok;
}

Errc QrEncoder::encode_multipart(const std::vector<std::uint8_t> &data,
                                 ContentType                      type,
                                 std::vector<std::string>        &frames) const
{
    const std::size_t fsize = opts_.animation.fragment_size;
    if (fsize == 0)
    {
        LOG_ERROR("encode_multipart: fragment_size must be >= 1");
        return Errc::InvalidData;
    }
    if (!fits_u32(data.size()))
    {
        LOG_ERROR("encode_multipart: payload of %zu bytes does not fit u32 sizes", data.size());
        return Errc::PayloadTooLarge;
    }

    // an empty payload still travels as one (empty) part
    const std::size_t total    = std::max<std::size_t>(1, (data.size() + fsize - 1) / fsize);
    const std::string msg_id   = codec::random_message_id();
    const std::uint32_t crc    = codec::crc32(data);

    frames.clear();
    frames.reserve(total);
    for (std::size_t i = 0; i < total; ++i)
    {
        const std::size_t start = std::min(i * fsize, data.size());
        const std::size_t take  = std::min(fsize, data.size() - start);

        frame::MultiPart f;
        f.message_id   = msg_id;
        f.part         = static_cast<std::uint32_t>(i);
        f.total        = static_cast<std::uint32_t>(total);
        f.total_size   = static_cast<std::uint32_t>(data.size());
        f.content_type = content_type_str(type);
        f.data         = codec::base64_encode(data.data() + start, take);
        if (i + 1 == total)
            f.checksum = crc;
        frames.push_back(frame::serialize(f));
    }
    LOG_DEBUG("encode_multipart: %zu bytes -> %zu frames (id=%s)", data.size(), total,
              msg_id.c_str());
    return Errc::Ok;
}

Errc QrEncoder::encode_fountain(const std::vector<std::uint8_t> &data,
                                ContentType                      type,
                                std::vector<std::string>        &frames) const
{
    if (!fits_u32(data.size()))
    {
        LOG_ERROR("encode_fountain: payload of %zu bytes does not fit u32 sizes", data.size());
        return Errc::PayloadTooLarge;
    }
    const std::size_t fs = opts_.animation.fragment_size;
    if (fs > 0 && (data.size() + fs - 1) / fs > constants::MAX_FOUNTAIN_FRAGMENTS)
    {
        LOG_ERROR("encode_fountain: %zu bytes at fragment size %zu exceeds %zu fragments",
                  data.size(), fs, constants::MAX_FOUNTAIN_FRAGMENTS);
        return Errc::PayloadTooLarge;
    }
    auto stream = FountainStream::create(data, type, fs);
    if (!stream)
        return Errc::InvalidData;

    const std::size_t n = stream->fragment_count() + opts_.animation.redundancy_frames;
    if (!fits_u32(n))
        return Errc::PayloadTooLarge;

    frames.clear();
    frames.reserve(n);
    for (std::size_t seq = 0; seq < n; ++seq)
        frames.push_back(stream->frame(static_cast<std::uint32_t>(seq)));
    LOG_DEBUG("encode_fountain: %zu bytes -> K=%zu, %zu frames (id=%s)", data.size(),
              stream->fragment_count(), n, stream->message_id().c_str());
    return Errc::Ok;
}

Errc QrEncoder::encode_psbt(const std::vector<std::uint8_t> &psbt,
                            std::vector<std::string>        &frames) const
{
    return encode_fountain(psbt, ContentType::Psbt, frames);
}

Errc QrEncoder::encode_eth_transaction(const std::vector<std::uint8_t> &tx,
                                       std::vector<std::string>        &frames) const
{
    return encode(tx, ContentType::EthTransaction, frames);
}

Errc QrEncoder::encode_signature(const std::vector<std::uint8_t> &sig,
                                 std::vector<std::string>        &frames) const
{
    return encode(sig, ContentType::Signature, frames);
}

Errc QrEncoder::encode_account_info(const AccountInfo &info, std::vector<std::string> &frames) const
{
    std::string json;
    const Errc  rc = to_json(info, json);
    if (rc != Errc::Ok)
        return rc;
    return encode(std::vector<std::uint8_t>(json.begin(), json.end()), ContentType::AccountInfo,
                  frames);
}

Errc QrEncoder::encode_ur(ur::UrType                       type,
                          const std::vector<std::uint8_t> &data,
                          std::vector<std::string>        &frames) const
{
    return ur::UrEncoder(type, data, opts_.animation.fragment_size).encode(frames);
}

// ---------------------------------------------------------------------------
// FountainStream
// ---------------------------------------------------------------------------

FountainStream::FountainStream(fountain::Encoder enc,
                               std::string       message_id,
                               std::string       content_type,
                               std::uint32_t     checksum)
    : enc_(std::move(enc)),
      message_id_(std::move(message_id)),
      content_type_(std::move(content_type)),
      checksum_(checksum)
{
}

std::optional<FountainStream> FountainStream::create(const std::vector<std::uint8_t> &data,
                                                     ContentType                      type,
                                                     std::size_t fragment_size)
{
    if (!fits_u32(data.size()))
    {
        LOG_ERROR("FountainStream::create: payload too large (%zu bytes)", data.size());
        return std::nullopt;
    }
    if (fragment_size > 0 &&
        (data.size() + fragment_size - 1) / fragment_size > constants::MAX_FOUNTAIN_FRAGMENTS)
    {
        LOG_ERROR("FountainStream::create: more than %zu fragments needed",
                  constants::MAX_FOUNTAIN_FRAGMENTS);
        return std::nullopt;
    }
    auto enc = fountain::Encoder::create(data, fragment_size);
    if (!enc)
        return std::nullopt;
    return FountainStream{std::move(*enc), codec::random_message_id(), content_type_str(type),
                          codec::crc32(data)};
}

std::string FountainStream::frame(std::uint32_t seq) const
{
    const fountain::Part p = enc_.next_part(seq);

    frame::Fountain f;
    f.message_id     = message_id_;
    f.seq            = seq;
    f.fragment_count = static_cast<std::uint32_t>(enc_.fragment_count());
    f.message_len    = static_cast<std::uint32_t>(enc_.message_len());
    f.content_type   = content_type_;
    f.indexes.assign(p.indexes.begin(), p.indexes.end());
    f.data     = codec::base64_encode(p.data);
    f.checksum = checksum_;
    return frame::serialize(f);
}

}  // namespace qr
