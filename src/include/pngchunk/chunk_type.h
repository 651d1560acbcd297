#pragma once

#include "pngchunk/png_status.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file chunk_type.h
 * \brief PNG chunk type codes and their property bits.
 */

namespace pngchunk {

/**
 * \brief A 4-byte chunk type code.
 *
 * Codes are fixed binary values, not character strings. Each property is
 * carried by bit 5 of one byte (0 for an uppercase letter, 1 for a
 * lowercase letter):
 * - byte 0: ancillary bit (0 = critical)
 * - byte 1: private bit (0 = public)
 * - byte 2: reserved bit (must be 0)
 * - byte 3: safe-to-copy bit (1 = safe to copy)
 *
 * Building from raw bytes never fails; \ref is_valid reports whether the
 * code follows the naming rules. Building from text requires 4 ASCII
 * letters.
 */
class ChunkType final {
public:
    constexpr ChunkType() noexcept = default;

    /// Stores \p raw verbatim without validation.
    static constexpr ChunkType
    from_bytes(std::span<const std::byte, 4> raw) noexcept
    {
        ChunkType t;
        t.raw_ = { raw[0], raw[1], raw[2], raw[3] };
        return t;
    }

    /// Compile-time construction from 4 characters (no validation).
    static constexpr ChunkType from_chars(char a, char b, char c,
                                          char d) noexcept
    {
        ChunkType t;
        t.raw_ = {
            std::byte { static_cast<uint8_t>(a) },
            std::byte { static_cast<uint8_t>(b) },
            std::byte { static_cast<uint8_t>(c) },
            std::byte { static_cast<uint8_t>(d) },
        };
        return t;
    }

    /**
     * \brief Parses a chunk type from its 4-letter text form.
     *
     * Returns \ref PngStatus::InvalidFormat when \p text is not exactly 4
     * bytes or contains a byte outside `A-Z`/`a-z`. \p out is left
     * untouched on failure.
     */
    static PngStatus from_text(std::string_view text,
                               ChunkType* out) noexcept;

    constexpr const std::array<std::byte, 4>& bytes() const noexcept
    {
        return raw_;
    }

    /// Big-endian FourCC value of the code.
    constexpr uint32_t fourcc() const noexcept
    {
        return (static_cast<uint32_t>(raw_[0]) << 24)
               | (static_cast<uint32_t>(raw_[1]) << 16)
               | (static_cast<uint32_t>(raw_[2]) << 8)
               | (static_cast<uint32_t>(raw_[3]) << 0);
    }

    /// True when all bytes are ASCII letters and the reserved bit is clear.
    bool is_valid() const noexcept;

    constexpr bool is_critical() const noexcept { return !bit5(0); }
    constexpr bool is_public() const noexcept { return !bit5(1); }
    constexpr bool is_reserved_bit_valid() const noexcept { return !bit5(2); }
    constexpr bool is_safe_to_copy() const noexcept { return bit5(3); }

    /// The code as text, or "invalid" when the bytes are not valid UTF-8.
    std::string to_string() const;

    constexpr bool operator==(const ChunkType& other) const noexcept
        = default;

private:
    constexpr bool bit5(uint32_t index) const noexcept
    {
        return ((static_cast<uint8_t>(raw_[index]) >> 5) & 1U) != 0U;
    }

    std::array<std::byte, 4> raw_ {};
};

/// Chunk type that must appear first in a PNG stream.
inline constexpr ChunkType kHeaderChunkType = ChunkType::from_chars('I', 'H',
                                                                    'D', 'R');
/// Chunk type that ends a PNG stream; nothing may follow it.
inline constexpr ChunkType kTerminatorChunkType
    = ChunkType::from_chars('I', 'E', 'N', 'D');

}  // namespace pngchunk
