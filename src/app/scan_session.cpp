#include <variant>

#include "app/scan_session.hpp"
#include "util/log.hpp"

namespace qr
{

Errc ScanSession::feed(std::string_view text, ScanResult &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    ++seen_;
    const Errc rc = decoder_.decode(text, out);
    if (rc != Errc::Ok)
    {
        ++rejected_;
        LOG_DEBUG("frame %zu rejected: %s", seen_, errc_name(rc));
        return rc;
    }

    if (const auto *c = std::get_if<Complete>(&out))
    {
        ++completed_;
        LOG_INFO("payload complete: %zu bytes (%s) after %zu frames", c->data.size(),
                 c->content_type.c_str(), seen_);
        if (on_complete_)
            on_complete_(c->data, c->content_type);
    }
    else if (on_progress_)
    {
        if (const auto *p = std::get_if<Partial>(&out))
            on_progress_(p->progress);
        else if (const auto *fp = std::get_if<FountainProgress>(&out))
            on_progress_(fp->progress);
    }
    return Errc::Ok;
}

void ScanSession::reset()
{
    std::lock_guard<std::mutex> lk(mu_);
    decoder_.reset();
}

std::size_t ScanSession::frames_seen() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return seen_;
}

std::size_t ScanSession::frames_rejected() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return rejected_;
}

std::size_t ScanSession::messages_completed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return completed_;
}

}  // namespace qr
