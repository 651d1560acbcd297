#pragma once

#include <cstddef>
#include <span>

namespace pngchunk::text_internal {

// Strict UTF-8 check: rejects overlong forms, surrogates, code points
// above U+10FFFF and truncated sequences.
bool
is_valid_utf8(std::span<const std::byte> bytes) noexcept;

bool
is_ascii_letter(std::byte b) noexcept;

}  // namespace pngchunk::text_internal
