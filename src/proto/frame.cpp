#include <json/json.h>
#include <memory>

#include "proto/frame.hpp"
#include "util/log.hpp"

namespace frame
{

static std::string to_compact(const Json::Value &root)
{
    Json::StreamWriterBuilder b;
    b["indentation"] = "";  // one line, one QR payload
    return Json::writeString(b, root);
}

std::string serialize(const Single &f)
{
    Json::Value v(Json::objectValue);
    v["content_type"] = f.content_type;
    v["data"]         = f.data;
    v["checksum"]     = Json::UInt(f.checksum);
    return to_compact(v);
}

std::string serialize(const MultiPart &f)
{
    Json::Value v(Json::objectValue);
    v["message_id"]   = f.message_id;
    v["part"]         = Json::UInt(f.part);
    v["total"]        = Json::UInt(f.total);
    v["total_size"]   = Json::UInt(f.total_size);
    v["content_type"] = f.content_type;
    v["data"]         = f.data;
    if (f.checksum)
        v["checksum"] = Json::UInt(*f.checksum);
    return to_compact(v);
}

std::string serialize(const Fountain &f)
{
    Json::Value v(Json::objectValue);
    v["message_id"]     = f.message_id;
    v["seq"]            = Json::UInt(f.seq);
    v["fragment_count"] = Json::UInt(f.fragment_count);
    v["message_len"]    = Json::UInt(f.message_len);
    v["content_type"]   = f.content_type;
    Json::Value idx(Json::arrayValue);
    for (std::uint32_t i : f.indexes)
        idx.append(Json::UInt(i));
    v["indexes"]  = idx;
    v["data"]     = f.data;
    v["checksum"] = Json::UInt(f.checksum);
    return to_compact(v);
}

namespace
{

bool get_u32(const Json::Value &v, const char *key, std::uint32_t &out)
{
    const Json::Value &f = v[key];
    if (!f.isUInt())
    {
        LOG_WARN("frame: field '%s' missing or not a u32", key);
        return false;
    }
    out = f.asUInt();
    return true;
}

bool get_str(const Json::Value &v, const char *key, std::string &out)
{
    const Json::Value &f = v[key];
    if (!f.isString())
    {
        LOG_WARN("frame: field '%s' missing or not a string", key);
        return false;
    }
    out = f.asString();
    return true;
}

bool parse_single(const Json::Value &v, Single &f)
{
    return get_str(v, "content_type", f.content_type) && get_str(v, "data", f.data) &&
           get_u32(v, "checksum", f.checksum);
}

bool parse_multipart(const Json::Value &v, MultiPart &f)
{
    if (!get_str(v, "message_id", f.message_id) || !get_u32(v, "part", f.part) ||
        !get_u32(v, "total", f.total) || !get_u32(v, "total_size", f.total_size) ||
        !get_str(v, "content_type", f.content_type) || !get_str(v, "data", f.data))
        return false;
    if (v.isMember("checksum"))
    {
        std::uint32_t c = 0;
        if (!get_u32(v, "checksum", c))
            return false;
        f.checksum = c;
    }
    return true;
}

bool parse_fountain(const Json::Value &v, Fountain &f)
{
    if (!get_str(v, "message_id", f.message_id) || !get_u32(v, "seq", f.seq) ||
        !get_u32(v, "fragment_count", f.fragment_count) ||
        !get_u32(v, "message_len", f.message_len) ||
        !get_str(v, "content_type", f.content_type) || !get_str(v, "data", f.data) ||
        !get_u32(v, "checksum", f.checksum))
        return false;

    const Json::Value &idx = v["indexes"];
    if (!idx.isArray())
    {
        LOG_WARN("frame: 'indexes' is not an array");
        return false;
    }
    f.indexes.clear();
    f.indexes.reserve(idx.size());
    for (const auto &e : idx)
    {
        if (!e.isUInt())
        {
            LOG_WARN("frame: 'indexes' element is not a u32");
            return false;
        }
        f.indexes.push_back(e.asUInt());
    }
    return true;
}

}  // namespace

qr::Errc parse(std::string_view text, Frame &out)
{
    Json::CharReaderBuilder b;
    Json::CharReaderBuilder::strictMode(&b.settings_);
    std::unique_ptr<Json::CharReader> reader(b.newCharReader());

    Json::Value root;
    std::string errs;
    try
    {
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs))
        {
            LOG_WARN("frame: invalid JSON: %s", errs.c_str());
            return qr::Errc::InvalidData;
        }
    }
    catch (const Json::Exception &e)
    {
        // jsoncpp throws on nesting beyond its stack limit
        LOG_WARN("frame: invalid JSON: %s", e.what());
        return qr::Errc::InvalidData;
    }

    if (!root.isObject())
    {
        LOG_WARN("frame: top-level JSON is not an object");
        return qr::Errc::InvalidData;
    }

    if (root.isMember("indexes"))
    {
        Fountain f;
        if (!parse_fountain(root, f))
            return qr::Errc::InvalidData;
        out = std::move(f);
    }
    else if (root.isMember("message_id") && root.isMember("part"))
    {
        MultiPart f;
        if (!parse_multipart(root, f))
            return qr::Errc::InvalidData;
        out = std::move(f);
    }
    else if (root.isMember("data"))
    {
        Single f;
        if (!parse_single(root, f))
            return qr::Errc::InvalidData;
        out = std::move(f);
    }
    else
    {
        LOG_WARN("frame: unknown frame shape");
        return qr::Errc::InvalidData;
    }
    return qr::Errc::Ok;
}

}  // namespace frame
