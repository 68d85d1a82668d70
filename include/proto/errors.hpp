#pragma once

namespace qr
{

enum class Errc
{
    Ok = 0,
    InvalidData,         // malformed JSON, unknown frame shape, bad base64, bad part
    ChecksumMismatch,    // assembled payload fails CRC32
    IncompleteMessage,   // multi-part assembly attempted with a hole
    DecodingIncomplete,  // fountain result() before every fragment is recovered
    PayloadTooLarge,     // a value does not fit the wire format
    FountainError,       // encoder could not be built for this input
    UnsupportedUrType    // "ur:" string names a type this build does not know
};

inline const char *errc_name(Errc e)
{
    switch (e)
    {
        case Errc::Ok:
            return "ok";
        case Errc::InvalidData:
            return "invalid data";
        case Errc::ChecksumMismatch:
            return "checksum mismatch";
        case Errc::IncompleteMessage:
            return "incomplete message";
        case Errc::DecodingIncomplete:
            return "decoding incomplete";
        case Errc::PayloadTooLarge:
            return "payload too large";
        case Errc::FountainError:
            return "fountain code error";
        case Errc::UnsupportedUrType:
            return "unsupported UR type";
    }
    return "?";
}

}  // namespace qr
