#pragma once

#include "pngchunk/chunk.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pngchunk {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`, `"` and `\`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any control/non-ASCII escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out);

// Like append_console_escaped_ascii, but leaves `"` and `\` as is.
// Used where the text is printed bare rather than inside quotes.
bool
append_console_text(std::string_view s, uint32_t max_bytes, std::string* out);

// Appends uppercase hex bytes into `out` (no "0x" prefix).
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out);

// Appends a one-line description of `chunk`:
//
//   tEXt len=12 crc=0x1A2B3C4D ancillary public safe data="Comment..."
//
// The payload preview is quoted escaped text when it is valid UTF-8 and
// hex otherwise, limited to `max_preview_bytes` (0 = no preview).
void
append_chunk_summary(const Chunk& chunk, uint32_t max_preview_bytes,
                     std::string* out);

}  // namespace pngchunk
