#include <json/json.h>
#include <memory>
#include <utility>

#include "app/airgap.hpp"
#include "crypto/codec.hpp"
#include "util/log.hpp"

namespace qr
{

namespace
{

struct RequestTypeName
{
    AirGapRequestType type;
    const char       *name;
};

constexpr RequestTypeName kRequestTypes[] = {
    {AirGapRequestType::SignTransaction, "sign_transaction"},
    {AirGapRequestType::SignPsbt, "sign_psbt"},
    {AirGapRequestType::SignMessage, "sign_message"},
    {AirGapRequestType::SignTypedData, "sign_typed_data"},
    {AirGapRequestType::GetAccount, "get_account"},
    {AirGapRequestType::GetPublicKey, "get_public_key"},
};

std::string to_compact(const Json::Value &root)
{
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    return Json::writeString(b, root);
}

bool read_json(std::string_view text, Json::Value &root, const char *what)
{
    Json::CharReaderBuilder b;
    Json::CharReaderBuilder::strictMode(&b.settings_);
    std::unique_ptr<Json::CharReader> reader(b.newCharReader());

    std::string errs;
    try
    {
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs))
        {
            LOG_WARN("%s: invalid JSON: %s", what, errs.c_str());
            return false;
        }
    }
    catch (const Json::Exception &e)
    {
        LOG_WARN("%s: invalid JSON: %s", what, e.what());
        return false;
    }
    return true;
}

bool parse_object(std::string_view text, Json::Value &root, const char *what)
{
    if (!read_json(text, root, what))
        return false;
    if (!root.isObject())
    {
        LOG_WARN("%s: top-level JSON is not an object", what);
        return false;
    }
    return true;
}

// metadata is kept as text; embed it as a real JSON value, not a string
bool put_metadata(Json::Value &v, const std::optional<std::string> &metadata)
{
    if (!metadata)
        return true;
    Json::Value m;
    if (!read_json(*metadata, m, "airgap metadata"))
        return false;
    v["metadata"] = m;
    return true;
}

void get_metadata(const Json::Value &v, std::optional<std::string> &out)
{
    out.reset();
    if (v.isMember("metadata") && !v["metadata"].isNull())
        out = to_compact(v["metadata"]);
}

bool get_str(const Json::Value &v, const char *key, std::string &out)
{
    const Json::Value &f = v[key];
    if (!f.isString())
    {
        LOG_WARN("airgap: field '%s' missing or not a string", key);
        return false;
    }
    out = f.asString();
    return true;
}

bool get_b64(const Json::Value &f, const char *key, std::vector<std::uint8_t> &out)
{
    if (!f.isString() || !codec::base64_decode(f.asString(), out))
    {
        LOG_WARN("airgap: field '%s' missing or not base64", key);
        return false;
    }
    return true;
}

}  // namespace

const char *request_type_str(AirGapRequestType t)
{
    for (const auto &rt : kRequestTypes)
        if (rt.type == t)
            return rt.name;
    return "sign_transaction";
}

bool parse_request_type(std::string_view s, AirGapRequestType &out)
{
    for (const auto &rt : kRequestTypes)
    {
        if (s == rt.name)
        {
            out = rt.type;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// factories
// ---------------------------------------------------------------------------

static AirGapRequest make_request(AirGapRequestType         type,
                                  std::string               chain,
                                  std::vector<std::uint8_t> payload)
{
    AirGapRequest r;
    r.type       = type;
    r.chain      = std::move(chain);
    r.request_id = codec::random_message_id();
    r.payload    = std::move(payload);
    return r;
}

AirGapRequest AirGapRequest::sign_transaction(const std::string        &chain,
                                              std::vector<std::uint8_t> tx)
{
    return make_request(AirGapRequestType::SignTransaction, chain, std::move(tx));
}

AirGapRequest AirGapRequest::sign_psbt(std::vector<std::uint8_t> psbt)
{
    return make_request(AirGapRequestType::SignPsbt, "bitcoin", std::move(psbt));
}

AirGapRequest AirGapRequest::sign_message(const std::string &chain, std::vector<std::uint8_t> msg)
{
    return make_request(AirGapRequestType::SignMessage, chain, std::move(msg));
}

AirGapRequest AirGapRequest::sign_typed_data(const std::string        &chain,
                                             std::vector<std::uint8_t> typed_data)
{
    return make_request(AirGapRequestType::SignTypedData, chain, std::move(typed_data));
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

Errc to_json(const AirGapRequest &req, std::string &out)
{
    Json::Value v(Json::objectValue);
    v["request_type"] = request_type_str(req.type);
    v["chain"]        = req.chain;
    v["request_id"]   = req.request_id;
    v["payload"]      = codec::base64_encode(req.payload);
    if (!put_metadata(v, req.metadata))
        return Errc::InvalidData;
    out = to_compact(v);
    return Errc::Ok;
}

Errc to_json(const AirGapResponse &resp, std::string &out)
{
    Json::Value v(Json::objectValue);
    v["request_id"] = resp.request_id;
    Json::Value sigs(Json::arrayValue);
    for (const auto &s : resp.signatures)
        sigs.append(codec::base64_encode(s));
    v["signatures"] = sigs;
    if (resp.public_key)
        v["public_key"] = codec::base64_encode(*resp.public_key);
    if (!put_metadata(v, resp.metadata))
        return Errc::InvalidData;
    out = to_compact(v);
    return Errc::Ok;
}

Errc to_json(const AccountInfo &info, std::string &out)
{
    Json::Value v(Json::objectValue);
    v["name"]            = info.name;
    v["chain"]           = info.chain;
    v["public_key"]      = info.public_key;
    v["address"]         = info.address;
    v["derivation_path"] = info.derivation_path;
    if (info.master_fingerprint)
        v["master_fingerprint"] = *info.master_fingerprint;
    out = to_compact(v);
    return Errc::Ok;
}

Errc from_json(std::string_view text, AirGapRequest &out)
{
    Json::Value root;
    if (!parse_object(text, root, "airgap request"))
        return Errc::InvalidData;

    AirGapRequest r;
    std::string   type;
    if (!get_str(root, "request_type", type) || !get_str(root, "chain", r.chain) ||
        !get_str(root, "request_id", r.request_id) ||
        !get_b64(root["payload"], "payload", r.payload))
        return Errc::InvalidData;
    if (!parse_request_type(type, r.type))
    {
        LOG_WARN("airgap: unknown request type '%s'", type.c_str());
        return Errc::InvalidData;
    }
    get_metadata(root, r.metadata);
    out = std::move(r);
    return Errc::Ok;
}

Errc from_json(std::string_view text, AirGapResponse &out)
{
    Json::Value root;
    if (!parse_object(text, root, "airgap response"))
        return Errc::InvalidData;

    AirGapResponse r;
    if (!get_str(root, "request_id", r.request_id))
        return Errc::InvalidData;
    const Json::Value &sigs = root["signatures"];
    if (!sigs.isArray())
    {
        LOG_WARN("airgap: 'signatures' is not an array");
        return Errc::InvalidData;
    }
    for (const auto &s : sigs)
    {
        std::vector<std::uint8_t> sig;
        if (!get_b64(s, "signatures", sig))
            return Errc::InvalidData;
        r.signatures.push_back(std::move(sig));
    }
    if (root.isMember("public_key"))
    {
        std::vector<std::uint8_t> pk;
        if (!get_b64(root["public_key"], "public_key", pk))
            return Errc::InvalidData;
        r.public_key = std::move(pk);
    }
    get_metadata(root, r.metadata);
    out = std::move(r);
    return Errc::Ok;
}

Errc from_json(std::string_view text, AccountInfo &out)
{
    Json::Value root;
    if (!parse_object(text, root, "account info"))
        return Errc::InvalidData;

    AccountInfo a;
    if (!get_str(root, "name", a.name) || !get_str(root, "chain", a.chain) ||
        !get_str(root, "public_key", a.public_key) || !get_str(root, "address", a.address) ||
        !get_str(root, "derivation_path", a.derivation_path))
        return Errc::InvalidData;
    if (root.isMember("master_fingerprint"))
    {
        std::string fp;
        if (!get_str(root, "master_fingerprint", fp))
            return Errc::InvalidData;
        a.master_fingerprint = std::move(fp);
    }
    out = std::move(a);
    return Errc::Ok;
}

}  // namespace qr
