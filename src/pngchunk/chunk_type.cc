#include "pngchunk/chunk_type.h"

#include "text_internal.h"

namespace pngchunk {

PngStatus
ChunkType::from_text(std::string_view text, ChunkType* out) noexcept
{
    if (text.size() != 4U) {
        return PngStatus::InvalidFormat;
    }
    ChunkType t;
    for (size_t i = 0; i < 4U; ++i) {
        const std::byte b { static_cast<uint8_t>(text[i]) };
        if (!text_internal::is_ascii_letter(b)) {
            return PngStatus::InvalidFormat;
        }
        t.raw_[i] = b;
    }
    if (out) {
        *out = t;
    }
    return PngStatus::Ok;
}


bool
ChunkType::is_valid() const noexcept
{
    for (size_t i = 0; i < raw_.size(); ++i) {
        if (!text_internal::is_ascii_letter(raw_[i])) {
            return false;
        }
    }
    return is_reserved_bit_valid();
}


std::string
ChunkType::to_string() const
{
    if (!text_internal::is_valid_utf8(raw_)) {
        return "invalid";
    }
    return std::string(reinterpret_cast<const char*>(raw_.data()),
                       raw_.size());
}

}  // namespace pngchunk
