#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "app/qr_decoder.hpp"

namespace qr
{

using OnProgress = std::function<void(float progress)>;
using OnComplete = std::function<void(const std::vector<std::uint8_t> &data,
                                      const std::string               &content_type)>;

// Serialises access to one QrDecoder so several camera pipelines can feed it.
// Callbacks run on the feeding thread with the session lock held; they must not call back in.
class ScanSession
{
  public:
    ScanSession() = default;
    ScanSession(OnProgress on_progress, OnComplete on_complete)
        : on_progress_(std::move(on_progress)), on_complete_(std::move(on_complete))
    {
    }

    Errc feed(std::string_view text, ScanResult &out);
    Errc feed(std::string_view text)
    {
        ScanResult ignored;
        return feed(text, ignored);
    }
    void reset();

    std::size_t frames_seen() const;
    std::size_t frames_rejected() const;
    std::size_t messages_completed() const;

  private:
    mutable std::mutex mu_;
    QrDecoder          decoder_;
    OnProgress         on_progress_;
    OnComplete         on_complete_;
    std::size_t        seen_{0};
    std::size_t        rejected_{0};
    std::size_t        completed_{0};
};

}  // namespace qr
