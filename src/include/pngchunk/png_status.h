#pragma once

#include <cstdint>

/**
 * \file png_status.h
 * \brief Status codes shared by the chunk codec and container parser.
 */

namespace pngchunk {

/// Result status for chunk and container operations.
enum class PngStatus : uint8_t {
    Ok,
    /// The first 8 bytes are not the PNG signature.
    BadSignature,
    /// The buffer ends before a declared field or length is satisfied.
    TruncatedInput,
    /// The stored CRC does not match the CRC recomputed over type + data.
    ChecksumMismatch,
    /// The buffer ended before an `IEND` chunk was decoded.
    MissingTerminator,
    /// The first chunk is not `IHDR`.
    MissingHeader,
    /// A chunk follows `IEND`.
    TerminatorNotLast,
    /// Chunk type text is not exactly 4 ASCII letters.
    InvalidFormat,
    /// The length prefix has the reserved top bit set.
    InvalidLength,
    /// The payload is not valid UTF-8.
    InvalidEncoding,
    /// No chunk of the requested type exists.
    NotFound,
    /// A configured decode budget was exceeded.
    LimitExceeded,
};

/// Returns a stable snake_case name for \p status.
const char*
png_status_name(PngStatus status) noexcept;

}  // namespace pngchunk
