#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proto/errors.hpp"

// Uniform Resource strings for wallets that speak "ur:" instead of JSON frames.
//
//   single     ur:<type>/<bytewords>
//   multipart  ur:<type>/<seq>-<count>/<bytewords slice>    seq is 1-based
//
// The bytewords body carries the payload plus a big-endian CRC32 of it. A
// multipart message is the minimal-style body cut into fixed-width slices, so
// the checksum is only verified once every slice is present.

namespace ur
{

enum class UrType
{
    Bytes,
    CryptoPsbt,
    CryptoAccount,
    CryptoHdkey,
    CryptoOutput,
    CryptoSeed,
    EthSignRequest,
    EthSignature,
    SolSignRequest,
    SolSignature
};

const char *ur_type_str(UrType t);
// Case-insensitive; false for a name not in the table
bool parse_ur_type(std::string_view s, UrType &out);

enum class BytewordsStyle
{
    Standard,  // "able acid also"
    Minimal,   // "aead ao": first and last letter of each word
    Uri        // "able-acid-also"
};

std::string bytewords_encode(const std::vector<std::uint8_t> &data, BytewordsStyle style);
// InvalidData for unknown words or a body shorter than the checksum,
// ChecksumMismatch when the trailing CRC32 disagrees
qr::Errc bytewords_decode(std::string_view in, BytewordsStyle style,
                          std::vector<std::uint8_t> &out);

// Bodies up to this many characters go out as one single-part string
inline constexpr std::size_t SINGLE_PART_MAX_CHARS = 200;
inline constexpr std::size_t DEFAULT_UR_FRAGMENT_CHARS = 100;

class UrEncoder
{
  public:
    UrEncoder(UrType type, std::vector<std::uint8_t> data,
              std::size_t fragment_chars = DEFAULT_UR_FRAGMENT_CHARS);

    std::string encode_single() const;
    // InvalidData when fragment_chars is 0
    qr::Errc encode_multipart(std::vector<std::string> &parts) const;
    // Single string when the body fits SINGLE_PART_MAX_CHARS, else multipart
    qr::Errc encode(std::vector<std::string> &parts) const;

  private:
    UrType                    type_;
    std::vector<std::uint8_t> data_;
    std::size_t               fragment_chars_;
};

class UrDecoder
{
  public:
    UrDecoder() = default;
    explicit UrDecoder(UrType expected) : expected_(expected) {}

    static qr::Errc decode_single(std::string_view text, UrType &type,
                                  std::vector<std::uint8_t> &out);

    // Feeds one string; complete is set once every slice of the message is held.
    // Duplicates are accepted and ignored.
    qr::Errc receive(std::string_view text, bool &complete);
    qr::Errc result(UrType &type, std::vector<std::uint8_t> &out) const;

    float       progress() const;
    std::size_t received() const { return parts_.size(); }
    std::size_t total() const { return total_; }
    void        reset();

  private:
    std::optional<UrType>              expected_;
    std::optional<UrType>              type_;
    std::size_t                        total_{0};
    std::map<std::size_t, std::string> parts_;  // seq -> slice
};

}  // namespace ur
