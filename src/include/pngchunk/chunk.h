#pragma once

#include "pngchunk/chunk_type.h"
#include "pngchunk/png_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file chunk.h
 * \brief A single PNG chunk: type, opaque payload and CRC-32.
 *
 * Wire layout: `[u32 BE length][4-byte type][length bytes][u32 BE CRC]`.
 * The CRC covers the type and payload only.
 */

namespace pngchunk {

/// Bytes a chunk adds around its payload (length + type + CRC).
inline constexpr uint32_t kChunkOverheadBytes = 12U;

/// Largest payload the format allows (the top length bit is reserved).
inline constexpr uint32_t kMaxChunkDataBytes = 0x7FFFFFFFU;

/// Resource limits applied while decoding untrusted input.
struct PngDecodeLimits final {
    uint32_t max_chunks      = 1U << 16;
    uint32_t max_chunk_bytes = kMaxChunkDataBytes;
    /// Upper bound on the summed payload size (0 = unlimited).
    uint64_t max_total_bytes = 0;
};

/// Options for \ref decode_chunk.
struct ChunkDecodeOptions final {
    PngDecodeLimits limits;
};

/**
 * \brief CRC-32/ISO-HDLC as used by PNG (zlib's `crc32`).
 *
 * Check value: `png_crc32("123456789") == 0xCBF43926`.
 */
uint32_t
png_crc32(std::span<const std::byte> bytes) noexcept;

/// Continues a running CRC started with `png_crc32({})`.
uint32_t
png_crc32_update(uint32_t crc, std::span<const std::byte> bytes) noexcept;

/**
 * \brief One chunk. Owns its type and payload; the CRC is derived.
 */
class Chunk final {
public:
    Chunk() = default;
    Chunk(ChunkType type, std::vector<std::byte> data);

    const ChunkType& type() const noexcept { return type_; }
    std::span<const std::byte> data() const noexcept { return data_; }

    /// Payload size in bytes.
    uint32_t length() const noexcept;

    /// CRC over type bytes followed by payload bytes.
    uint32_t checksum() const noexcept;

    /// Size of the encoded record (\ref length + 12).
    uint64_t encoded_size() const noexcept;

    /// Appends the encoded record to \p out.
    void encode(std::vector<std::byte>* out) const;

    /// Copies the payload into \p out if it is valid UTF-8.
    PngStatus data_as_text(std::string* out) const;

    bool operator==(const Chunk& other) const = default;

private:
    ChunkType type_;
    std::vector<std::byte> data_;
};

struct ChunkDecodeResult final {
    PngStatus status = PngStatus::Ok;
    /// Bytes consumed from the input on success.
    uint64_t consumed = 0;
};

/**
 * \brief Decodes one chunk from the start of \p bytes.
 *
 * Failure modes:
 * - \ref PngStatus::TruncatedInput: fewer bytes than the header or the
 *   declared length require.
 * - \ref PngStatus::InvalidLength: the length has bit 31 set.
 * - \ref PngStatus::LimitExceeded: the length exceeds
 *   \ref PngDecodeLimits::max_chunk_bytes.
 * - \ref PngStatus::ChecksumMismatch: stored CRC differs from the
 *   recomputed one.
 *
 * \p out is only written on success.
 */
ChunkDecodeResult
decode_chunk(std::span<const std::byte> bytes, Chunk* out,
             const ChunkDecodeOptions& options);

}  // namespace pngchunk
