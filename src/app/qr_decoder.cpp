#include <utility>
#include <variant>

#include "app/qr_decoder.hpp"
#include "crypto/codec.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace qr
{

Errc QrDecoder::decode(std::string_view text, ScanResult &out)
{
    frame::Frame f;
    const Errc   rc = frame::parse(text, f);
    if (rc != Errc::Ok)
        return rc;

    if (const auto *fo = std::get_if<frame::Fountain>(&f))
        return on_fountain(*fo, out);
    if (const auto *mp = std::get_if<frame::MultiPart>(&f))
        return on_multipart(*mp, out);
    return on_single(std::get<frame::Single>(f), out);
}

void QrDecoder::reset()
{
    if (!pending_.empty() || fountain_)
        LOG_DEBUG("reset: dropping %zu pending message(s)%s", pending_.size(),
                  fountain_ ? " and the fountain decoder" : "");
    pending_.clear();
    clear_fountain();
}

void QrDecoder::clear_fountain()
{
    fountain_.reset();
    fountain_id_.reset();
    fountain_type_.clear();
}

Errc QrDecoder::on_single(const frame::Single &f, ScanResult &out)
{
    std::vector<std::uint8_t> data;
    if (!codec::base64_decode(f.data, data))
    {
        LOG_WARN("single frame: bad base64");
        return Errc::InvalidData;
    }
    const std::uint32_t crc = codec::crc32(data);
    if (crc != f.checksum)
    {
        LOG_WARN("single frame: checksum mismatch (got %08x, expect %08x)", crc, f.checksum);
        return Errc::ChecksumMismatch;
    }
    out = Complete{std::move(data), f.content_type};
    return Errc::Ok;
}

Errc QrDecoder::on_multipart(const frame::MultiPart &f, ScanResult &out)
{
    // validate everything before touching the accumulator
    if (f.total == 0 || f.part >= f.total)
    {
        LOG_WARN("multipart %s: part %u outside total %u", f.message_id.c_str(), f.part, f.total);
        return Errc::InvalidData;
    }
    std::vector<std::uint8_t> data;
    if (!codec::base64_decode(f.data, data))
    {
        LOG_WARN("multipart %s: bad base64 in part %u", f.message_id.c_str(), f.part);
        return Errc::InvalidData;
    }

    auto it = pending_.find(f.message_id);
    if (it != pending_.end() && f.part >= it->second.total_parts)
    {
        LOG_WARN("multipart %s: part %u outside recorded total %zu", f.message_id.c_str(), f.part,
                 it->second.total_parts);
        return Errc::InvalidData;
    }
    if (it == pending_.end())
    {
        PendingMessage pm;
        pm.total_parts  = f.total;
        pm.total_size   = f.total_size;
        pm.content_type = f.content_type;
        it              = pending_.emplace(f.message_id, std::move(pm)).first;
        LOG_DEBUG("multipart %s: new message, %u parts, %u bytes", f.message_id.c_str(), f.total,
                  f.total_size);
    }
    else if (f.total != it->second.total_parts)
    {
        LOG_WARN("multipart %s: frame says total %u, keeping %zu from first frame",
                 f.message_id.c_str(), f.total, it->second.total_parts);
    }

    PendingMessage &pm = it->second;
    if (f.checksum)
    {
        if (pm.expected_checksum && *pm.expected_checksum != *f.checksum)
        {
            // frames of one message disagree; nothing assembled from them can be trusted
            LOG_WARN("multipart %s: conflicting checksums %08x / %08x, discarding",
                     f.message_id.c_str(), *pm.expected_checksum, *f.checksum);
            pending_.erase(it);
            return Errc::ChecksumMismatch;
        }
        pm.expected_checksum = f.checksum;
    }
    pm.parts[f.part] = std::move(data);  // re-scans overwrite

    if (pm.parts.size() < pm.total_parts)
    {
        Partial p;
        p.received = pm.parts.size();
        p.total    = pm.total_parts;
        p.progress = static_cast<float>(p.received) / static_cast<float>(p.total);
        out        = p;
        return Errc::Ok;
    }

    std::vector<std::uint8_t> message;
    std::string               content_type = pm.content_type;
    const Errc                rc           = assemble(pm, message);
    // done with this message either way; a bad assembly must be re-sent from scratch
    pending_.erase(it);
    if (rc != Errc::Ok)
        return rc;

    LOG_DEBUG("multipart %s: complete, %zu bytes", f.message_id.c_str(), message.size());
    out = Complete{std::move(message), std::move(content_type)};
    return Errc::Ok;
}

Errc QrDecoder::assemble(const PendingMessage &pm, std::vector<std::uint8_t> &out) const
{
    out.clear();
    // size from what actually arrived; total_size is only a claim until it matches
    std::size_t received_bytes = 0;
    for (std::size_t i = 0; i < pm.total_parts; ++i)
    {
        auto it = pm.parts.find(i);
        if (it == pm.parts.end())
        {
            LOG_ERROR("assemble: missing part %zu (received %zu/%zu)", i, pm.parts.size(),
                      pm.total_parts);
            return Errc::IncompleteMessage;
        }
        received_bytes += it->second.size();
    }
    if (received_bytes != pm.total_size)
    {
        LOG_WARN("assemble: got %zu bytes, header says %zu", received_bytes, pm.total_size);
        return Errc::InvalidData;
    }

    out.reserve(received_bytes);
    for (const auto &kv : pm.parts)
        out.insert(out.end(), kv.second.begin(), kv.second.end());

    if (pm.expected_checksum)
    {
        const std::uint32_t crc = codec::crc32(out);
        if (crc != *pm.expected_checksum)
        {
            LOG_WARN("assemble: checksum mismatch (got %08x, expect %08x)", crc,
                     *pm.expected_checksum);
            return Errc::ChecksumMismatch;
        }
    }
    return Errc::Ok;
}

Errc QrDecoder::on_fountain(const frame::Fountain &f, ScanResult &out)
{
    if (f.fragment_count == 0 || f.message_len == 0)
    {
        LOG_WARN("fountain %s: empty message header", f.message_id.c_str());
        return Errc::InvalidData;
    }
    if (f.fragment_count > f.message_len)
    {
        LOG_WARN("fountain %s: %u fragments for %u bytes", f.message_id.c_str(), f.fragment_count,
                 f.message_len);
        return Errc::InvalidData;
    }
    if (f.fragment_count > constants::MAX_FOUNTAIN_FRAGMENTS)
    {
        LOG_WARN("fountain %s: %u fragments exceeds limit %zu", f.message_id.c_str(),
                 f.fragment_count, constants::MAX_FOUNTAIN_FRAGMENTS);
        return Errc::PayloadTooLarge;
    }

    fountain::Part part;
    part.indexes.assign(f.indexes.begin(), f.indexes.end());
    if (!codec::base64_decode(f.data, part.data))
    {
        LOG_WARN("fountain %s: bad base64 in seq %u", f.message_id.c_str(), f.seq);
        return Errc::InvalidData;
    }

    const bool same_message = fountain_ && fountain_id_ == f.message_id;
    if (same_message)
    {
        if (fountain_->fragment_count() != f.fragment_count ||
            fountain_->message_len() != f.message_len)
        {
            LOG_WARN("fountain %s: header changed mid-transfer (K %zu -> %u)",
                     f.message_id.c_str(), fountain_->fragment_count(), f.fragment_count);
            return Errc::InvalidData;
        }
        const Errc rc = fountain_->receive_part(std::move(part));
        if (rc != Errc::Ok)
            return rc;
    }
    else
    {
        // a new message supersedes the old one; only commit once its first part is accepted
        fountain::Decoder fresh(f.fragment_count, f.message_len);
        const Errc        rc = fresh.receive_part(std::move(part));
        if (rc != Errc::Ok)
            return rc;
        if (fountain_id_)
            LOG_INFO("fountain: switching from %s to %s, discarding progress",
                     fountain_id_->c_str(), f.message_id.c_str());
        fountain_.emplace(std::move(fresh));
        fountain_id_   = f.message_id;
        fountain_type_ = f.content_type;
    }

    if (!fountain_->is_complete())
    {
        FountainProgress p;
        p.progress   = fountain_->progress();
        p.can_decode = fountain_->can_decode();
        out          = p;
        return Errc::Ok;
    }

    std::vector<std::uint8_t> message;
    const Errc                rc = fountain_->result(message);
    std::string               content_type = fountain_type_;
    clear_fountain();
    if (rc != Errc::Ok)
        return rc;

    const std::uint32_t crc = codec::crc32(message);
    if (crc != f.checksum)
    {
        LOG_WARN("fountain %s: checksum mismatch (got %08x, expect %08x)", f.message_id.c_str(),
                 crc, f.checksum);
        return Errc::ChecksumMismatch;
    }
    LOG_DEBUG("fountain %s: complete, %zu bytes", f.message_id.c_str(), message.size());
    out = Complete{std::move(message), std::move(content_type)};
    return Errc::Ok;
}

std::optional<std::string> QrDecoder::pending_content_type(const std::string &message_id) const
{
    auto it = pending_.find(message_id);
    if (it == pending_.end())
        return std::nullopt;
    return it->second.content_type;
}

std::optional<float> QrDecoder::message_progress(const std::string &message_id) const
{
    auto it = pending_.find(message_id);
    if (it == pending_.end())
        return std::nullopt;
    const PendingMessage &pm = it->second;
    return static_cast<float>(pm.parts.size()) / static_cast<float>(pm.total_parts);
}

std::vector<std::string> QrDecoder::pending_messages() const
{
    std::vector<std::string> ids;
    ids.reserve(pending_.size());
    for (const auto &kv : pending_)
        ids.push_back(kv.first);
    return ids;
}

std::optional<fountain::DecoderStats> QrDecoder::fountain_stats() const
{
    if (!fountain_)
        return std::nullopt;
    return fountain_->stats();
}

}  // namespace qr
