#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <vector>

#include "app/airgap.hpp"
#include "app/qr_decoder.hpp"
#include "app/qr_encoder.hpp"
#include "proto/frame.hpp"

using namespace qr;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 3 + 1) & 0xFF);
    return v;
}

static bool is_hex16(const std::string &s)
{
    if (s.size() != 16)
        return false;
    for (char c : s)
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    return true;
}

static Complete decode_all(const std::vector<std::string> &frames)
{
    QrDecoder  dec;
    ScanResult r;
    for (const auto &f : frames)
    {
        EXPECT_EQ(dec.decode(f, r), Errc::Ok);
        if (std::holds_alternative<Complete>(r))
            return std::get<Complete>(r);
    }
    ADD_FAILURE() << "frames never completed";
    return Complete{};
}

TEST(AirGap, RequestFactories)
{
    const auto tx = AirGapRequest::sign_transaction("ethereum", {1, 2, 3});
    EXPECT_EQ(tx.type, AirGapRequestType::SignTransaction);
    EXPECT_EQ(tx.chain, "ethereum");
    EXPECT_EQ(tx.payload, (std::vector<std::uint8_t>{1, 2, 3}));
    EXPECT_TRUE(is_hex16(tx.request_id)) << tx.request_id;
    EXPECT_FALSE(tx.metadata.has_value());

    const auto psbt = AirGapRequest::sign_psbt(gen_bytes(10));
    EXPECT_EQ(psbt.type, AirGapRequestType::SignPsbt);
    EXPECT_EQ(psbt.chain, "bitcoin");
    EXPECT_NE(psbt.request_id, tx.request_id);

    EXPECT_EQ(AirGapRequest::sign_message("solana", {'h', 'i'}).type,
              AirGapRequestType::SignMessage);
    EXPECT_EQ(AirGapRequest::sign_typed_data("ethereum", {'{', '}'}).type,
              AirGapRequestType::SignTypedData);

    AirGapRequestType t = AirGapRequestType::SignPsbt;
    EXPECT_TRUE(parse_request_type("get_public_key", t));
    EXPECT_EQ(t, AirGapRequestType::GetPublicKey);
    EXPECT_STREQ(request_type_str(AirGapRequestType::GetAccount), "get_account");
    EXPECT_FALSE(parse_request_type("SignPsbt", t));
}

TEST(AirGap, RequestJson)
{
    auto req     = AirGapRequest::sign_typed_data("ethereum", gen_bytes(300));
    req.metadata = R"({ "domain" : "example", "nonce" : 7 })";

    std::string json;
    ASSERT_EQ(to_json(req, json), Errc::Ok);
    EXPECT_NE(json.find("\"request_type\":\"sign_typed_data\""), std::string::npos) << json;

    AirGapRequest back;
    ASSERT_EQ(from_json(json, back), Errc::Ok);
    EXPECT_EQ(back.type, req.type);
    EXPECT_EQ(back.chain, req.chain);
    EXPECT_EQ(back.request_id, req.request_id);
    EXPECT_EQ(back.payload, req.payload);
    ASSERT_TRUE(back.metadata.has_value());
    EXPECT_EQ(*back.metadata, R"({"domain":"example","nonce":7})");

    req.metadata = "{not json";
    EXPECT_EQ(to_json(req, json), Errc::InvalidData);
}

TEST(AirGap, ResponseJson)
{
    AirGapResponse resp;
    resp.request_id = "00112233445566ff";
    resp.signatures = {gen_bytes(64), gen_bytes(65)};

    std::string json;
    ASSERT_EQ(to_json(resp, json), Errc::Ok);
    EXPECT_EQ(json.find("public_key"), std::string::npos);

    AirGapResponse back;
    ASSERT_EQ(from_json(json, back), Errc::Ok);
    EXPECT_EQ(back.request_id, resp.request_id);
    EXPECT_EQ(back.signatures, resp.signatures);
    EXPECT_FALSE(back.public_key.has_value());
    EXPECT_FALSE(back.metadata.has_value());

    resp.public_key = gen_bytes(33);
    ASSERT_EQ(to_json(resp, json), Errc::Ok);
    ASSERT_EQ(from_json(json, back), Errc::Ok);
    ASSERT_TRUE(back.public_key.has_value());
    EXPECT_EQ(*back.public_key, *resp.public_key);
}

TEST(AirGap, MalformedJsonRejected)
{
    AirGapRequest req;
    EXPECT_EQ(from_json("[]", req), Errc::InvalidData);
    EXPECT_EQ(from_json("{", req), Errc::InvalidData);
    EXPECT_EQ(from_json(R"({"request_type":"sign_psbt","chain":"bitcoin","request_id":"x",)"
                        R"("payload":"***"})",
                        req),
              Errc::InvalidData);
    EXPECT_EQ(from_json(R"({"request_type":"steal_keys","chain":"bitcoin","request_id":"x",)"
                        R"("payload":""})",
                        req),
              Errc::InvalidData);
    EXPECT_EQ(from_json(R"({"request_type":"sign_psbt","chain":"bitcoin","payload":""})", req),
              Errc::InvalidData);

    AirGapResponse resp;
    EXPECT_EQ(from_json(R"({"request_id":"x","signatures":"AAAA"})", resp), Errc::InvalidData);
    EXPECT_EQ(from_json(R"({"request_id":"x","signatures":[1]})", resp), Errc::InvalidData);
    EXPECT_EQ(from_json(R"({"request_id":"x","signatures":[],"public_key":5})", resp),
              Errc::InvalidData);

    AccountInfo info;
    EXPECT_EQ(from_json(R"({"name":"a","chain":"b","public_key":"c","address":"d"})", info),
              Errc::InvalidData);
}

TEST(AirGap, AccountInfoThroughFrames)
{
    AccountInfo info;
    info.name            = "Bitcoin Account";
    info.chain           = "bitcoin";
    info.public_key      = "02a1b2c3";
    info.address         = "bc1qexample";
    info.derivation_path = "m/84'/0'/0'";

    std::string json;
    ASSERT_EQ(to_json(info, json), Errc::Ok);
    EXPECT_EQ(json.find("master_fingerprint"), std::string::npos);

    info.master_fingerprint = "73c5da0a";
    std::vector<std::string> frames;
    ASSERT_EQ(QrEncoder().encode_account_info(info, frames), Errc::Ok);
    ASSERT_EQ(frames.size(), 1u);

    const Complete c = decode_all(frames);
    EXPECT_EQ(c.content_type, "application/json");

    AccountInfo back;
    ASSERT_EQ(from_json(std::string(c.data.begin(), c.data.end()), back), Errc::Ok);
    EXPECT_EQ(back.name, info.name);
    EXPECT_EQ(back.derivation_path, info.derivation_path);
    ASSERT_TRUE(back.master_fingerprint.has_value());
    EXPECT_EQ(*back.master_fingerprint, "73c5da0a");
}

TEST(AirGap, EncoderConveniences)
{
    QrOptions o;
    o.animation.fragment_size     = 50;
    o.animation.redundancy_frames = 200;
    QrEncoder enc(o);

    // a PSBT small enough for one symbol still goes out as fountain frames
    const auto               psbt = gen_bytes(120);
    std::vector<std::string> frames;
    ASSERT_EQ(enc.encode_psbt(psbt, frames), Errc::Ok);
    ASSERT_EQ(frames.size(), 3u + 200u);
    frame::Frame f;
    ASSERT_EQ(frame::parse(frames[0], f), Errc::Ok);
    ASSERT_TRUE(std::holds_alternative<frame::Fountain>(f));
    EXPECT_EQ(std::get<frame::Fountain>(f).content_type, "application/psbt");
    EXPECT_EQ(decode_all(frames).data, psbt);

    ASSERT_EQ(enc.encode_signature(gen_bytes(65), frames), Errc::Ok);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(decode_all(frames).content_type, "application/signature");

    ASSERT_EQ(enc.encode_eth_transaction(gen_bytes(3000), frames), Errc::Ok);
    EXPECT_EQ(frames.size(), 60u);
    const Complete tx = decode_all(frames);
    EXPECT_EQ(tx.content_type, "application/eth-tx");
    EXPECT_EQ(tx.data, gen_bytes(3000));

    ASSERT_EQ(enc.encode_ur(ur::UrType::CryptoPsbt, gen_bytes(20), frames), Errc::Ok);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].rfind("ur:crypto-psbt/", 0), 0u);
}
