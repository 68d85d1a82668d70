#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "proto/errors.hpp"

// One frame == one QR symbol, carried as a compact JSON object.
//
//   single    {content_type, data, checksum}
//   multipart {message_id, part, total, total_size, content_type, data, checksum?}
//   fountain  {message_id, seq, fragment_count, message_len, content_type, indexes, data, checksum}
//
// `data` is base64 (standard alphabet, padded); checksums are CRC32 of the whole
// decoded message, never of one frame.

namespace frame
{

struct Single
{
    std::string   content_type;
    std::string   data;
    std::uint32_t checksum{0};
};

struct MultiPart
{
    std::string                  message_id;
    std::uint32_t                part{0};
    std::uint32_t                total{0};
    std::uint32_t                total_size{0};
    std::string                  content_type;
    std::string                  data;
    std::optional<std::uint32_t> checksum;  // only on the last part
};

struct Fountain
{
    std::string                message_id;
    std::uint32_t              seq{0};
    std::uint32_t              fragment_count{0};
    std::uint32_t              message_len{0};
    std::string                content_type;
    std::vector<std::uint32_t> indexes;
    std::string                data;
    std::uint32_t              checksum{0};
};

using Frame = std::variant<Single, MultiPart, Fountain>;

std::string serialize(const Single &f);
std::string serialize(const MultiPart &f);
std::string serialize(const Fountain &f);

// Classify by shape: "indexes" -> Fountain, "message_id"+"part" -> MultiPart,
// "data" -> Single. Anything else, or a field of the wrong type, is InvalidData.
qr::Errc parse(std::string_view text, Frame &out);

}  // namespace frame
