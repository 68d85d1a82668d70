#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "app/qr_types.hpp"
#include "proto/errors.hpp"
#include "proto/fountain.hpp"
#include "proto/frame.hpp"

namespace qr
{

// Receiver side. Feed every scanned string to decode(); it classifies the frame,
// advances the matching reassembly state and reports progress or the payload.
// Not thread-safe: wrap in ScanSession when several pipelines share one instance.
class QrDecoder
{
  public:
    Errc decode(std::string_view text, ScanResult &out);

    // Drop every multi-part accumulator and the active fountain decoder
    void reset();

    std::optional<std::string>   pending_content_type(const std::string &message_id) const;
    std::optional<float>         message_progress(const std::string &message_id) const;
    std::vector<std::string>     pending_messages() const;
    std::optional<fountain::DecoderStats> fountain_stats() const;
    const std::optional<std::string> &fountain_message_id() const { return fountain_id_; }

  private:
    struct PendingMessage
    {
        std::size_t                                     total_parts = 0;
        std::size_t                                     total_size  = 0;
        std::string                                     content_type;
        std::map<std::size_t, std::vector<std::uint8_t>> parts;  // ordered by part index
        std::optional<std::uint32_t>                    expected_checksum;
    };

    Errc on_single(const frame::Single &f, ScanResult &out);
    Errc on_multipart(const frame::MultiPart &f, ScanResult &out);
    Errc on_fountain(const frame::Fountain &f, ScanResult &out);
    Errc assemble(const PendingMessage &pm, std::vector<std::uint8_t> &out) const;
    void clear_fountain();

    std::unordered_map<std::string, PendingMessage> pending_;
    std::optional<fountain::Decoder>                fountain_;
    std::optional<std::string>                      fountain_id_;
    std::string                                     fountain_type_;
};

}  // namespace qr
