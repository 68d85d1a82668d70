#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <optional>
#include <iostream>
#include <iterator>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/qr_encoder.hpp"
#include "app/scan_session.hpp"
#include "proto/ur.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

struct Options
{
    bool                      fountain = false;
    std::optional<ur::UrType> ur_type;
    qr::QrOptions             qr{};
    qr::ContentType           type = qr::ContentType::RawBytes;
    std::string               in_path;
    std::string               out_path;
};

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  qrstreamctl [-v] <command> [options]\n"
                         "\n"
                         "Commands:\n"
                         "  encode [--fountain | --ur <ur-type>] [--fragment-size N]\n"
                         "         [--redundancy N] [--ec L|M|Q|H] [--type <content-type>]\n"
                         "         [--in FILE]\n"
                         "      write one frame (or ur: string) per line to stdout\n"
                         "  decode [--out FILE]\n"
                         "      read frame or ur: lines from stdin, write the payload when\n"
                         "      complete\n"
                         "\n"
                         "Environment:\n"
                         "  QRSTREAM_FRAGMENT_SIZE, QRSTREAM_REDUNDANCY, QRSTREAM_LOG_LEVEL\n");
}

static bool parse_size(const std::string &s, std::size_t maxv, std::size_t &out)
{
    if (s.empty())
        return false;
    char              *end = nullptr;
    errno                  = 0;
    unsigned long long n   = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || s[0] == '-' || n > maxv)
        return false;
    out = static_cast<std::size_t>(n);
    return true;
}

static bool read_all(const std::string &path, std::vector<std::uint8_t> &out)
{
    if (path.empty() || path == "-")
    {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return !std::cin.bad();
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

static bool write_all(const std::string &path, const std::vector<std::uint8_t> &data)
{
    if (path.empty() || path == "-")
    {
        std::cout.write(reinterpret_cast<const char *>(data.data()),
                        static_cast<std::streamsize>(data.size()));
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
        return false;
    ofs.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(ofs);
}

static int parse_options(const std::vector<std::string> &args, Options &o)
{
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string &a        = args[i];
        const bool         has_next = i + 1 < args.size();
        if (a == "--fountain")
        {
            o.fountain = true;
        }
        else if (a == "--fragment-size" && has_next)
        {
            std::size_t n = 0;
            if (!parse_size(args[++i], constants::MAX_FRAGMENT_SIZE, n) || n == 0)
            {
                std::fprintf(stderr, "error: --fragment-size expects 1..%zu\n",
                             constants::MAX_FRAGMENT_SIZE);
                return exitc::bad_args;
            }
            o.qr.animation.fragment_size = n;
        }
        else if (a == "--redundancy" && has_next)
        {
            std::size_t n = 0;
            if (!parse_size(args[++i], 1u << 16, n))
            {
                std::fprintf(stderr, "error: --redundancy expects a non-negative integer\n");
                return exitc::bad_args;
            }
            o.qr.animation.redundancy_frames = n;
        }
        else if (a == "--ur" && has_next)
        {
            ur::UrType t = ur::UrType::Bytes;
            if (!ur::parse_ur_type(args[++i], t))
            {
                std::fprintf(stderr, "error: unknown UR type: %s\n", args[i].c_str());
                return exitc::bad_args;
            }
            o.ur_type = t;
        }
        else if (a == "--ec" && has_next)
        {
            auto ec = qr::parse_ec_level(args[++i]);
            if (!ec)
            {
                std::fprintf(stderr, "error: --ec expects L, M, Q or H\n");
                return exitc::bad_args;
            }
            o.qr.error_correction = *ec;
        }
        else if (a == "--type" && has_next)
        {
            auto t = qr::parse_content_type(args[++i]);
            if (!t)
            {
                std::fprintf(stderr, "error: unknown content type: %s\n", args[i].c_str());
                return exitc::bad_args;
            }
            o.type = *t;
        }
        else if (a == "--in" && has_next)
        {
            o.in_path = args[++i];
        }
        else if (a == "--out" && has_next)
        {
            o.out_path = args[++i];
        }
        else
        {
            std::fprintf(stderr, "error: unexpected argument: %s\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
    }
    if (o.fountain && o.ur_type)
    {
        std::fprintf(stderr, "error: --fountain and --ur are exclusive\n");
        return exitc::bad_args;
    }
    return exitc::ok;
}

static int cmd_encode(const Options &o)
{
    std::vector<std::uint8_t> payload;
    if (!read_all(o.in_path, payload))
    {
        std::fprintf(stderr, "error: cannot read %s\n",
                     o.in_path.empty() ? "stdin" : o.in_path.c_str());
        return exitc::io_error;
    }

    qr::QrEncoder            enc(o.qr);
    std::vector<std::string> frames;
    qr::Errc                 rc = qr::Errc::Ok;
    if (o.ur_type)
        rc = enc.encode_ur(*o.ur_type, payload, frames);
    else if (o.fountain)
        rc = enc.encode_fountain(payload, o.type, frames);
    else
        rc = enc.encode(payload, o.type, frames);
    if (rc != qr::Errc::Ok)
    {
        std::fprintf(stderr, "error: encode failed: %s\n", qr::errc_name(rc));
        return exitc::bad_args;
    }
    for (const auto &f : frames)
        std::cout << f << '\n';
    std::cout.flush();
    LOG_INFO("encoded %zu bytes into %zu frame(s)", payload.size(), frames.size());
    return std::cout ? exitc::ok : exitc::io_error;
}

static int cmd_decode(const Options &o)
{
    std::vector<std::uint8_t> result;
    bool                      done = false;
    qr::ScanSession           session([](float p) { LOG_DEBUG("progress %.1f%%", p * 100.0f); },
                            [&](const std::vector<std::uint8_t> &data, const std::string &) {
                                result = data;
                                done   = true;
                            });

    ur::UrDecoder urdec;
    bool          corrupt = false;
    std::string   line;
    while (!done && std::getline(std::cin, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        if (line.size() > 3 && (line[0] == 'u' || line[0] == 'U') &&
            (line[1] == 'r' || line[1] == 'R') && line[2] == ':')
        {
            bool     complete = false;
            qr::Errc rc       = urdec.receive(line, complete);
            if (rc == qr::Errc::Ok && complete)
            {
                ur::UrType t = ur::UrType::Bytes;
                rc           = urdec.result(t, result);
                done         = rc == qr::Errc::Ok;
                urdec.reset();
            }
            if (rc == qr::Errc::ChecksumMismatch)
                corrupt = true;
            else if (rc != qr::Errc::Ok)
                LOG_WARN("skipping ur string: %s", qr::errc_name(rc));
            continue;
        }
        const qr::Errc rc = session.feed(line);
        if (rc == qr::Errc::ChecksumMismatch)
            corrupt = true;
        else if (rc != qr::Errc::Ok)
            LOG_WARN("skipping frame: %s", qr::errc_name(rc));
    }

    if (!done)
    {
        std::fprintf(stderr, "error: %s after %zu frame(s)\n",
                     corrupt ? "payload failed checksum"
                             : "input ended before payload was complete",
                     session.frames_seen());
        return corrupt ? exitc::corrupt : exitc::incomplete;
    }
    if (!write_all(o.out_path, result))
    {
        std::fprintf(stderr, "error: cannot write %s\n",
                     o.out_path.empty() ? "stdout" : o.out_path.c_str());
        return exitc::io_error;
    }
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args)
{
    Options o;
    o.qr.animation.fragment_size     = constants::fragment_size();
    o.qr.animation.redundancy_frames = constants::redundancy_frames();

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"encode", [&]() -> int { return cmd_encode(o); }},
        {"decode", [&]() -> int { return cmd_decode(o); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    const int rc = parse_options(args, o);
    if (rc != exitc::ok)
        return rc;
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    qrstream::set_log_level(qrstream::Level::Warning);
    qrstream::init_log_from_env();

    std::vector<std::string> args;
    args.reserve(argc > 1 ? argc - 1 : 0);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "-v" || a == "--verbose")
            qrstream::set_log_level(qrstream::Level::Debug);
        else
            args.push_back(std::move(a));
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    return run_cmd(args[0], args);
}
