#include "pngchunk/png_status.h"

namespace pngchunk {

const char*
png_status_name(PngStatus status) noexcept
{
    switch (status) {
    case PngStatus::Ok: return "ok";
    case PngStatus::BadSignature: return "bad_signature";
    case PngStatus::TruncatedInput: return "truncated_input";
    case PngStatus::ChecksumMismatch: return "checksum_mismatch";
    case PngStatus::MissingTerminator: return "missing_terminator";
    case PngStatus::MissingHeader: return "missing_header";
    case PngStatus::TerminatorNotLast: return "terminator_not_last";
    case PngStatus::InvalidFormat: return "invalid_format";
    case PngStatus::InvalidLength: return "invalid_length";
    case PngStatus::InvalidEncoding: return "invalid_encoding";
    case PngStatus::NotFound: return "not_found";
    case PngStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace pngchunk
