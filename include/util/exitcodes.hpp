#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int bad_args   = 2;
inline constexpr int io_error   = 3;
inline constexpr int incomplete = 4;  // input ended before the payload was recovered
inline constexpr int corrupt    = 5;  // checksum or frame format failure
}  // namespace exitc
