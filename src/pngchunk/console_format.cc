#include "pngchunk/console_format.h"

#include "text_internal.h"

#include <cstdio>

namespace pngchunk {
namespace {

    static bool append_escaped(std::string_view s, uint32_t max_bytes,
                               bool escape_quotes, std::string* out)
    {
        bool dangerous   = false;
        const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                               ? static_cast<uint32_t>(s.size())
                               : max_bytes;

        out->reserve(out->size() + static_cast<size_t>(n));
        for (uint32_t i = 0; i < n; ++i) {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            switch (c) {
            case '\\':
            case '"':
                if (escape_quotes) {
                    out->push_back('\\');
                }
                out->push_back(static_cast<char>(c));
                continue;
            case '\n': out->append("\\n"); dangerous = true; continue;
            case '\r': out->append("\\r"); dangerous = true; continue;
            case '\t': out->append("\\t"); dangerous = true; continue;
            default: break;
            }
            if (c < 0x20U || c >= 0x7FU) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02X",
                              static_cast<unsigned>(c));
                out->append(buf);
                dangerous = true;
                continue;
            }
            out->push_back(static_cast<char>(c));
        }
        if (n < s.size()) {
            out->append("...");
            dangerous = true;
        }
        return dangerous;
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out)
{
    if (!out) {
        return false;
    }
    return append_escaped(s, max_bytes, true, out);
}


bool
append_console_text(std::string_view s, uint32_t max_bytes, std::string* out)
{
    if (!out) {
        return false;
    }
    return append_escaped(s, max_bytes, false, out);
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out)
{
    if (!out) {
        return;
    }
    static constexpr char kDigits[] = "0123456789ABCDEF";
    const size_t n = (max_bytes == 0U || bytes.size() < max_bytes)
                         ? bytes.size()
                         : static_cast<size_t>(max_bytes);

    out->reserve(out->size() + n * 2U);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kDigits[v >> 4]);
        out->push_back(kDigits[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


void
append_chunk_summary(const Chunk& chunk, uint32_t max_preview_bytes,
                     std::string* out)
{
    if (!out) {
        return;
    }
    const ChunkType& type = chunk.type();
    const std::string_view code(
        reinterpret_cast<const char*>(type.bytes().data()), 4);
    append_console_escaped_ascii(code, 0, out);

    char buf[48];
    std::snprintf(buf, sizeof(buf), " len=%u crc=0x%08X",
                  static_cast<unsigned>(chunk.length()),
                  static_cast<unsigned>(chunk.checksum()));
    out->append(buf);

    out->append(type.is_critical() ? " critical" : " ancillary");
    out->append(type.is_public() ? " public" : " private");
    out->append(type.is_safe_to_copy() ? " safe" : " unsafe");
    if (!type.is_valid()) {
        out->append(" invalid_type");
    }

    if (max_preview_bytes == 0U || chunk.length() == 0U) {
        return;
    }
    const std::span<const std::byte> data = chunk.data();
    if (text_internal::is_valid_utf8(data)) {
        const std::string_view text(reinterpret_cast<const char*>(
                                        data.data()),
                                    data.size());
        out->append(" data=\"");
        append_console_escaped_ascii(text, max_preview_bytes, out);
        out->push_back('"');
    } else {
        out->append(" data=0x");
        append_hex_bytes(data, max_preview_bytes, out);
    }
}

}  // namespace pngchunk
