#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proto/errors.hpp"

// Messages exchanged with an offline signer. Each one is a JSON document that
// travels as the payload of ordinary frames; binary fields are base64.

namespace qr
{

enum class AirGapRequestType
{
    SignTransaction,
    SignPsbt,
    SignMessage,
    SignTypedData,  // EIP-712
    GetAccount,
    GetPublicKey
};

const char *request_type_str(AirGapRequestType t);
bool        parse_request_type(std::string_view s, AirGapRequestType &out);

struct AirGapRequest
{
    AirGapRequestType          type{AirGapRequestType::SignTransaction};
    std::string                chain;
    std::string                request_id;  // 16 hex chars, echoed by the response
    std::vector<std::uint8_t>  payload;
    std::optional<std::string> metadata;  // compact JSON text

    static AirGapRequest sign_transaction(const std::string &chain, std::vector<std::uint8_t> tx);
    static AirGapRequest sign_psbt(std::vector<std::uint8_t> psbt);  // chain "bitcoin"
    static AirGapRequest sign_message(const std::string &chain, std::vector<std::uint8_t> msg);
    static AirGapRequest sign_typed_data(const std::string &chain,
                                         std::vector<std::uint8_t> typed_data);
};

struct AirGapResponse
{
    std::string                              request_id;
    std::vector<std::vector<std::uint8_t>>   signatures;
    std::optional<std::vector<std::uint8_t>> public_key;
    std::optional<std::string>               metadata;
};

struct AccountInfo
{
    std::string                name;
    std::string                chain;
    std::string                public_key;  // hex
    std::string                address;
    std::string                derivation_path;
    std::optional<std::string> master_fingerprint;  // omitted from JSON when unset
};

// to_json fails only when metadata is not valid JSON text.
// from_json returns InvalidData for bad JSON, missing or mistyped fields, or bad base64.
Errc to_json(const AirGapRequest &req, std::string &out);
Errc to_json(const AirGapResponse &resp, std::string &out);
Errc to_json(const AccountInfo &info, std::string &out);

Errc from_json(std::string_view text, AirGapRequest &out);
Errc from_json(std::string_view text, AirGapResponse &out);
Errc from_json(std::string_view text, AccountInfo &out);

}  // namespace qr
