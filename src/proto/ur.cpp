#include <array>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "crypto/codec.hpp"
#include "proto/ur.hpp"
#include "util/log.hpp"

namespace ur
{

namespace
{

// 256 four-letter words; first+last letter pairs are unique so the minimal
// style can be decoded without ambiguity
constexpr std::array<const char *, 256> kWords = {
    "able", "acid", "also", "apex", "aqua", "arch", "atom", "aunt",
    "away", "axis", "back", "bald", "barn", "beta", "bias", "blue",
    "body", "brag", "brew", "bulb", "buzz", "calm", "cash", "cats",
    "chef", "city", "claw", "code", "cola", "cook", "cost", "crux",
    "curl", "cusp", "cyan", "dark", "data", "days", "deli", "dice",
    "diet", "door", "drag", "down", "draw", "drop", "drum", "dull",
    "duty", "each", "easy", "echo", "edge", "epic", "even", "exam",
    "exit", "eyes", "fact", "fair", "fern", "figs", "film", "fish",
    "fizz", "flap", "flew", "flux", "foxy", "free", "frog", "fuel",
    "fund", "gala", "game", "gear", "gems", "gift", "girl", "glow",
    "good", "gray", "grim", "guru", "gush", "gyro", "half", "hang",
    "hard", "hawk", "heat", "help", "high", "hill", "holy", "hope",
    "horn", "huts", "iced", "idea", "idle", "inch", "inky", "into",
    "iris", "iron", "item", "jade", "jazz", "join", "jolt", "jowl",
    "judo", "jugs", "jump", "junk", "jury", "keep", "keno", "kept",
    "keys", "kick", "kiln", "king", "kite", "kiwi", "knob", "lamb",
    "lava", "lazy", "leaf", "legs", "liar", "limp", "lion", "list",
    "logo", "loud", "love", "luau", "luck", "lung", "main", "many",
    "math", "maze", "memo", "menu", "meow", "mild", "mint", "miss",
    "monk", "nail", "navy", "need", "news", "next", "noon", "note",
    "numb", "obey", "oboe", "omit", "onyx", "open", "oval", "owls",
    "paid", "part", "peck", "play", "plus", "poem", "pool", "pose",
    "puff", "puma", "purr", "quad", "quiz", "race", "ramp", "real",
    "redo", "rich", "road", "rock", "roof", "ruby", "ruin", "runs",
    "rust", "safe", "saga", "scar", "sets", "silk", "skew", "slot",
    "soap", "solo", "song", "stub", "surf", "swan", "taco", "task",
    "taxi", "tent", "tied", "time", "tiny", "toil", "tomb", "toys",
    "trip", "tuna", "twin", "ugly", "undo", "unit", "urge", "user",
    "vast", "very", "veto", "vial", "vibe", "view", "visa", "void",
    "vows", "wall", "warm", "wasp", "wave", "waxy", "webs", "what",
    "when", "whiz", "wolf", "work", "yawn", "yell", "yoga", "yurt",
    "zaps", "zero", "zest", "zinc", "zone", "zoom", "zulu", "zeal",
};

struct TypeName
{
    UrType      type;
    const char *name;
};

constexpr TypeName kTypes[] = {
    {UrType::Bytes, "bytes"},
    {UrType::CryptoPsbt, "crypto-psbt"},
    {UrType::CryptoAccount, "crypto-account"},
    {UrType::CryptoHdkey, "crypto-hdkey"},
    {UrType::CryptoOutput, "crypto-output"},
    {UrType::CryptoSeed, "crypto-seed"},
    {UrType::EthSignRequest, "eth-sign-request"},
    {UrType::EthSignature, "eth-signature"},
    {UrType::SolSignRequest, "sol-sign-request"},
    {UrType::SolSignature, "sol-signature"},
};

char lower(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string to_lower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(lower(c));
    return out;
}

// (first letter, last letter) -> byte, -1 when no word matches
const std::array<int, 26 * 26> &minimal_table()
{
    static const std::array<int, 26 * 26> table = [] {
        std::array<int, 26 * 26> t{};
        t.fill(-1);
        for (std::size_t i = 0; i < kWords.size(); ++i)
        {
            const char *w = kWords[i];
            t[(w[0] - 'a') * 26 + (w[3] - 'a')] = static_cast<int>(i);
        }
        return t;
    }();
    return table;
}

int lookup_pair(char a, char b)
{
    a = lower(a);
    b = lower(b);
    if (a < 'a' || a > 'z' || b < 'a' || b > 'z')
        return -1;
    return minimal_table()[(a - 'a') * 26 + (b - 'a')];
}

int lookup_word(std::string_view w)
{
    if (w.size() != 4)
        return -1;
    const std::string lw = to_lower(w);
    for (std::size_t i = 0; i < kWords.size(); ++i)
        if (lw == kWords[i])
            return static_cast<int>(i);
    return -1;
}

qr::Errc strip_checksum(std::vector<std::uint8_t> &bytes)
{
    if (bytes.size() < 4)
    {
        LOG_WARN("bytewords: %zu bytes is shorter than the checksum", bytes.size());
        return qr::Errc::InvalidData;
    }
    const std::size_t   n    = bytes.size() - 4;
    const std::uint32_t want = (std::uint32_t(bytes[n]) << 24) |
                               (std::uint32_t(bytes[n + 1]) << 16) |
                               (std::uint32_t(bytes[n + 2]) << 8) | std::uint32_t(bytes[n + 3]);
    bytes.resize(n);
    const std::uint32_t got = codec::crc32(bytes);
    if (got != want)
    {
        LOG_WARN("bytewords: checksum %08x, expected %08x", got, want);
        bytes.clear();
        return qr::Errc::ChecksumMismatch;
    }
    return qr::Errc::Ok;
}

bool parse_count(std::string_view s, std::size_t &out)
{
    if (s.empty() || s.size() > 9)
        return false;
    std::size_t n = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
        n = n * 10 + static_cast<std::size_t>(c - '0');
    }
    out = n;
    return true;
}

struct Parsed
{
    std::string_view type;
    std::size_t      seq{0};  // 0 for single-part
    std::size_t      total{0};
    std::string_view body;
};

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool parse_ur(std::string_view text, Parsed &out)
{
    text = trim(text);
    if (text.size() < 3 || to_lower(text.substr(0, 3)) != "ur:")
        return false;
    text.remove_prefix(3);

    std::vector<std::string_view> segs;
    std::size_t                   pos = 0;
    while (true)
    {
        const std::size_t slash = text.find('/', pos);
        segs.push_back(text.substr(pos, slash == std::string_view::npos ? slash : slash - pos));
        if (slash == std::string_view::npos)
            break;
        pos = slash + 1;
    }
    if (segs.size() != 2 && segs.size() != 3)
        return false;

    out      = Parsed{};
    out.type = segs[0];
    out.body = segs.back();
    if (segs.size() == 3)
    {
        const std::size_t dash = segs[1].find('-');
        if (dash == std::string_view::npos ||
            !parse_count(segs[1].substr(0, dash), out.seq) ||
            !parse_count(segs[1].substr(dash + 1), out.total))
            return false;
        if (out.total == 0 || out.seq == 0 || out.seq > out.total)
            return false;
    }
    return true;
}

}  // namespace

const char *ur_type_str(UrType t)
{
    for (const auto &tn : kTypes)
        if (tn.type == t)
            return tn.name;
    return "bytes";
}

bool parse_ur_type(std::string_view s, UrType &out)
{
    const std::string ls = to_lower(s);
    for (const auto &tn : kTypes)
    {
        if (ls == tn.name)
        {
            out = tn.type;
            return true;
        }
    }
    return false;
}

std::string bytewords_encode(const std::vector<std::uint8_t> &data, BytewordsStyle style)
{
    std::vector<std::uint8_t> full(data);
    const std::uint32_t       crc = codec::crc32(data);
    full.push_back(static_cast<std::uint8_t>(crc >> 24));
    full.push_back(static_cast<std::uint8_t>(crc >> 16));
    full.push_back(static_cast<std::uint8_t>(crc >> 8));
    full.push_back(static_cast<std::uint8_t>(crc));

    std::string out;
    out.reserve(full.size() * (style == BytewordsStyle::Minimal ? 2 : 5));
    for (std::uint8_t b : full)
    {
        const char *w = kWords[b];
        if (style == BytewordsStyle::Minimal)
        {
            out.push_back(w[0]);
            out.push_back(w[3]);
            continue;
        }
        if (!out.empty())
            out.push_back(style == BytewordsStyle::Uri ? '-' : ' ');
        out.append(w, 4);
    }
    return out;
}

qr::Errc bytewords_decode(std::string_view in, BytewordsStyle style,
                          std::vector<std::uint8_t> &out)
{
    out.clear();
    if (style == BytewordsStyle::Minimal)
    {
        if (in.size() % 2 != 0)
        {
            LOG_WARN("bytewords: odd minimal length %zu", in.size());
            return qr::Errc::InvalidData;
        }
        out.reserve(in.size() / 2);
        for (std::size_t i = 0; i < in.size(); i += 2)
        {
            const int b = lookup_pair(in[i], in[i + 1]);
            if (b < 0)
            {
                LOG_WARN("bytewords: unknown pair '%c%c' at %zu", in[i], in[i + 1], i);
                out.clear();
                return qr::Errc::InvalidData;
            }
            out.push_back(static_cast<std::uint8_t>(b));
        }
        return strip_checksum(out);
    }

    const char  sep = style == BytewordsStyle::Uri ? '-' : ' ';
    std::size_t pos = 0;
    while (pos <= in.size())
    {
        std::size_t end = in.find(sep, pos);
        if (end == std::string_view::npos)
            end = in.size();
        const int b = lookup_word(in.substr(pos, end - pos));
        if (b < 0)
        {
            LOG_WARN("bytewords: unknown word at %zu", pos);
            out.clear();
            return qr::Errc::InvalidData;
        }
        out.push_back(static_cast<std::uint8_t>(b));
        pos = end + 1;
    }
    return strip_checksum(out);
}

// ---------------------------------------------------------------------------
// UrEncoder
// ---------------------------------------------------------------------------

UrEncoder::UrEncoder(UrType type, std::vector<std::uint8_t> data, std::size_t fragment_chars)
    : type_(type), data_(std::move(data)), fragment_chars_(fragment_chars)
{
}

std::string UrEncoder::encode_single() const
{
    return std::string("ur:") + ur_type_str(type_) + "/" +
           bytewords_encode(data_, BytewordsStyle::Minimal);
}

qr::Errc UrEncoder::encode_multipart(std::vector<std::string> &parts) const
{
    if (fragment_chars_ == 0)
    {
        LOG_ERROR("ur: fragment size must be >= 1");
        return qr::Errc::InvalidData;
    }
    const std::string body  = bytewords_encode(data_, BytewordsStyle::Minimal);
    const std::size_t count = (body.size() + fragment_chars_ - 1) / fragment_chars_;

    parts.clear();
    parts.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        parts.push_back(std::string("ur:") + ur_type_str(type_) + "/" + std::to_string(i + 1) +
                        "-" + std::to_string(count) + "/" +
                        body.substr(i * fragment_chars_, fragment_chars_));
    }
    LOG_DEBUG("ur: %zu bytes -> %zu parts of %zu chars", data_.size(), count, fragment_chars_);
    return qr::Errc::Ok;
}

qr::Errc UrEncoder::encode(std::vector<std::string> &parts) const
{
    // body is 2 chars per byte plus 8 for the checksum
    if (data_.size() * 2 + 8 <= SINGLE_PART_MAX_CHARS)
    {
        parts.assign(1, encode_single());
        return qr::Errc::Ok;
    }
    return encode_multipart(parts);
}

// ---------------------------------------------------------------------------
// UrDecoder
// ---------------------------------------------------------------------------

qr::Errc UrDecoder::decode_single(std::string_view text, UrType &type,
                                  std::vector<std::uint8_t> &out)
{
    Parsed p;
    if (!parse_ur(text, p))
    {
        LOG_WARN("ur: malformed string");
        return qr::Errc::InvalidData;
    }
    if (!parse_ur_type(p.type, type))
    {
        LOG_WARN("ur: unknown type '%.*s'", static_cast<int>(p.type.size()), p.type.data());
        return qr::Errc::UnsupportedUrType;
    }
    if (p.total > 1)
    {
        LOG_WARN("ur: part %zu of %zu is not a whole message", p.seq, p.total);
        return qr::Errc::IncompleteMessage;
    }
    return bytewords_decode(p.body, BytewordsStyle::Minimal, out);
}

qr::Errc UrDecoder::receive(std::string_view text, bool &complete)
{
    complete = false;
    Parsed p;
    if (!parse_ur(text, p))
    {
        LOG_WARN("ur: malformed string");
        return qr::Errc::InvalidData;
    }
    UrType t = UrType::Bytes;
    if (!parse_ur_type(p.type, t))
    {
        LOG_WARN("ur: unknown type '%.*s'", static_cast<int>(p.type.size()), p.type.data());
        return qr::Errc::UnsupportedUrType;
    }
    if (expected_ && *expected_ != t)
    {
        LOG_WARN("ur: expected %s, got %s", ur_type_str(*expected_), ur_type_str(t));
        return qr::Errc::InvalidData;
    }

    const std::size_t seq   = p.seq == 0 ? 1 : p.seq;
    const std::size_t total = p.seq == 0 ? 1 : p.total;
    if (type_ && (*type_ != t || total_ != total))
    {
        LOG_WARN("ur: %s %zu parts does not continue %s %zu parts", ur_type_str(t), total,
                 ur_type_str(*type_), total_);
        return qr::Errc::InvalidData;
    }

    type_  = t;
    total_ = total;
    parts_.emplace(seq, std::string(p.body));  // keeps the first copy of a repeat
    complete = parts_.size() == total_;
    return qr::Errc::Ok;
}

qr::Errc UrDecoder::result(UrType &type, std::vector<std::uint8_t> &out) const
{
    if (!type_)
        return qr::Errc::DecodingIncomplete;
    if (parts_.size() < total_)
        return qr::Errc::IncompleteMessage;

    std::string body;
    for (const auto &kv : parts_)
        body += kv.second;
    type = *type_;
    return bytewords_decode(body, BytewordsStyle::Minimal, out);
}

float UrDecoder::progress() const
{
    if (total_ == 0)
        return 0.0f;
    return static_cast<float>(parts_.size()) / static_cast<float>(total_);
}

void UrDecoder::reset()
{
    type_.reset();
    total_ = 0;
    parts_.clear();
}

}  // namespace ur
