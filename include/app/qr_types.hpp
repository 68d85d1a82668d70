#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "util/constants.hpp"

namespace qr
{

enum class ErrorCorrectionLevel
{
    L,  // ~7% recovery
    M,  // ~15% recovery
    Q,  // ~25% recovery
    H   // ~30% recovery
};

inline std::size_t max_bytes(ErrorCorrectionLevel ec)
{
    switch (ec)
    {
        case ErrorCorrectionLevel::L:
            return constants::MAX_QR_BYTES_L;
        case ErrorCorrectionLevel::M:
            return constants::MAX_QR_BYTES_M;
        case ErrorCorrectionLevel::Q:
            return constants::MAX_QR_BYTES_Q;
        case ErrorCorrectionLevel::H:
            return constants::MAX_QR_BYTES_H;
    }
    return constants::MAX_QR_BYTES_M;
}

inline std::optional<ErrorCorrectionLevel> parse_ec_level(std::string_view s)
{
    if (s == "L" || s == "l")
        return ErrorCorrectionLevel::L;
    if (s == "M" || s == "m")
        return ErrorCorrectionLevel::M;
    if (s == "Q" || s == "q")
        return ErrorCorrectionLevel::Q;
    if (s == "H" || s == "h")
        return ErrorCorrectionLevel::H;
    return std::nullopt;
}

// Payload kinds understood by the air-gapped signer; the codec itself never looks inside.
enum class ContentType
{
    RawBytes,
    Psbt,
    EthTransaction,
    Signature,
    AccountInfo
};

inline const char *content_type_str(ContentType t)
{
    switch (t)
    {
        case ContentType::RawBytes:
            return "application/octet-stream";
        case ContentType::Psbt:
            return "application/psbt";
        case ContentType::EthTransaction:
            return "application/eth-tx";
        case ContentType::Signature:
            return "application/signature";
        case ContentType::AccountInfo:
            return "application/json";
    }
    return "application/octet-stream";
}

inline std::optional<ContentType> parse_content_type(std::string_view s)
{
    for (ContentType t : {ContentType::RawBytes, ContentType::Psbt, ContentType::EthTransaction,
                          ContentType::Signature, ContentType::AccountInfo})
    {
        if (s == content_type_str(t))
            return t;
    }
    return std::nullopt;
}

struct AnimationSettings
{
    std::size_t fragment_size     = constants::RECOMMENDED_FRAGMENT_SIZE;
    std::size_t redundancy_frames = constants::DEFAULT_REDUNDANCY_FRAMES;  // fountain frames past K
};

struct QrOptions
{
    ErrorCorrectionLevel error_correction = ErrorCorrectionLevel::M;
    AnimationSettings    animation{};
};

// --- decode results ---
struct Complete
{
    std::vector<std::uint8_t> data;
    std::string               content_type;
};

struct Partial
{
    std::size_t received = 0;
    std::size_t total    = 0;
    float       progress = 0.0f;
};

struct FountainProgress
{
    float progress   = 0.0f;
    bool  can_decode = false;
};

using ScanResult = std::variant<Complete, Partial, FountainProgress>;

}  // namespace qr
