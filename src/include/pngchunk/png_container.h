#pragma once

#include "pngchunk/chunk.h"
#include "pngchunk/chunk_type.h"
#include "pngchunk/png_status.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file png_container.h
 * \brief Ordered chunk sequence of a PNG stream: parse, edit, serialize.
 */

namespace pngchunk {

inline constexpr uint32_t kPngSignatureSize = 8U;

inline constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
    std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
    std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
    std::byte { 0x1A }, std::byte { 0x0A },
};

/// Options for \ref parse_png.
struct PngDecodeOptions final {
    PngDecodeLimits limits;
    /// Reject streams whose first chunk is not `IHDR`.
    bool require_header_first = true;
};

struct PngParseResult final {
    PngStatus status = PngStatus::Ok;
    /// Bytes consumed (signature included). On failure: offset of the
    /// chunk that could not be decoded.
    uint64_t consumed = 0;
    /// Chunks stored into the output container.
    uint32_t chunk_count = 0;
    /// Bytes left unread after `IEND`.
    uint64_t trailing_bytes = 0;
};

/**
 * \brief An ordered sequence of chunks.
 *
 * Header-first and terminator-last are checked by \ref parse_png and
 * \ref check_structure, not by the mutators: \ref append accepts chunks
 * after `IEND` and \ref serialize writes them out verbatim.
 */
class PngContainer final {
public:
    PngContainer() = default;
    explicit PngContainer(std::vector<Chunk> chunks);

    std::span<const Chunk> chunks() const noexcept { return chunks_; }
    uint32_t chunk_count() const noexcept;

    /// Pushes \p chunk to the end of the sequence.
    void append(Chunk chunk);

    /// Inserts \p chunk before the first `IEND`, or appends if none exists.
    void insert_before_terminator(Chunk chunk);

    /**
     * \brief Removes the first chunk whose type equals \p type.
     *
     * Returns \ref PngStatus::NotFound when there is no match. The removed
     * chunk is moved into \p removed when non-null.
     */
    PngStatus remove_by_type(const ChunkType& type, Chunk* removed);

    /// First chunk of \p type in sequence order, or nullptr.
    const Chunk* find_by_type(const ChunkType& type) const noexcept;

    void clear() noexcept;

    /**
     * \brief Checks the format-level ordering rules.
     *
     * Returns \ref PngStatus::MissingHeader, \ref PngStatus::MissingTerminator,
     * \ref PngStatus::TerminatorNotLast or \ref PngStatus::Ok.
     */
    PngStatus check_structure() const noexcept;

    /// Size of the \ref serialize output.
    uint64_t encoded_size() const noexcept;

    /// Appends the signature and every encoded chunk to \p out.
    void serialize(std::vector<std::byte>* out) const;
    std::vector<std::byte> serialize() const;

    bool operator==(const PngContainer& other) const = default;

private:
    std::vector<Chunk> chunks_;
};

/**
 * \brief Parses a PNG byte stream into \p out.
 *
 * The signature is checked before anything else. Chunks are decoded in
 * order until an `IEND` chunk has been stored. Running out of bytes
 * before that is \ref PngStatus::MissingTerminator; chunk decode failures
 * are propagated unchanged.
 *
 * \p out is cleared first. On failure it keeps the chunks decoded before
 * the failing one.
 */
PngParseResult
parse_png(std::span<const std::byte> bytes, PngContainer* out,
          const PngDecodeOptions& options);

}  // namespace pngchunk
