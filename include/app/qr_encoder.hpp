#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "app/airgap.hpp"
#include "app/qr_types.hpp"
#include "proto/errors.hpp"
#include "proto/fountain.hpp"
#include "proto/ur.hpp"

namespace qr
{

class QrEncoder
{
  public:
    QrEncoder() = default;
    explicit QrEncoder(const QrOptions &opts) : opts_(opts) {}

    // One single frame when the base64 payload fits one symbol, else numbered multi-part frames
    Errc encode(const std::vector<std::uint8_t> &data,
                ContentType                      type,
                std::vector<std::string>        &frames) const;

    Errc encode_single(const std::vector<std::uint8_t> &data,
                       ContentType                      type,
                       std::vector<std::string>        &frames) const;

    Errc encode_multipart(const std::vector<std::uint8_t> &data,
                          ContentType                      type,
                          std::vector<std::string>        &frames) const;

    // K + redundancy_frames fountain frames, seq 0..
    Errc encode_fountain(const std::vector<std::uint8_t> &data,
                         ContentType                      type,
                         std::vector<std::string>        &frames) const;

    // PSBTs are large and scanned by hand-held cameras, so they always go out as fountain frames
    Errc encode_psbt(const std::vector<std::uint8_t> &psbt, std::vector<std::string> &frames) const;
    Errc encode_eth_transaction(const std::vector<std::uint8_t> &tx,
                                std::vector<std::string>        &frames) const;
    Errc encode_signature(const std::vector<std::uint8_t> &sig,
                          std::vector<std::string>        &frames) const;
    Errc encode_account_info(const AccountInfo &info, std::vector<std::string> &frames) const;

    // "ur:" strings instead of JSON frames; fragment_size counts bytewords characters here
    Errc encode_ur(ur::UrType type, const std::vector<std::uint8_t> &data,
                   std::vector<std::string> &frames) const;

    const QrOptions &options() const { return opts_; }

  private:
    QrOptions opts_{};
};

// Sender side of an animated fountain: any seq can be rendered at any time,
// so the display loop only needs a counter.
class FountainStream
{
  public:
    static std::optional<FountainStream> create(const std::vector<std::uint8_t> &data,
                                                ContentType                      type,
                                                std::size_t                      fragment_size);

    std::string frame(std::uint32_t seq) const;

    const std::string &message_id() const { return message_id_; }
    std::size_t        fragment_count() const { return enc_.fragment_count(); }
    std::uint32_t      checksum() const { return checksum_; }

  private:
    FountainStream(fountain::Encoder enc, std::string message_id, std::string content_type,
                   std::uint32_t checksum);

    fountain::Encoder enc_;
    std::string       message_id_;
    std::string       content_type_;
    std::uint32_t     checksum_{0};
};

}  // namespace qr
