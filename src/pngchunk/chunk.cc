#include "pngchunk/chunk.h"

#include "text_internal.h"

#include <utility>

#include <zlib.h>

namespace pngchunk {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static uint32_t read_u32be(std::span<const std::byte> bytes,
                               size_t offset) noexcept
    {
        return (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
    }


    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }

}  // namespace

uint32_t
png_crc32_update(uint32_t crc, std::span<const std::byte> bytes) noexcept
{
    // zlib takes uInt lengths; feed large buffers in slices.
    static constexpr size_t kMaxSlice = size_t { 1 } << 30;

    uLong c       = static_cast<uLong>(crc);
    size_t offset = 0;
    while (offset < bytes.size()) {
        const size_t remaining = bytes.size() - offset;
        const size_t n = (remaining < kMaxSlice) ? remaining : kMaxSlice;
        c = ::crc32(c, reinterpret_cast<const Bytef*>(bytes.data() + offset),
                    static_cast<uInt>(n));
        offset += n;
    }
    return static_cast<uint32_t>(c);
}


uint32_t
png_crc32(std::span<const std::byte> bytes) noexcept
{
    return png_crc32_update(0U, bytes);
}


Chunk::Chunk(ChunkType type, std::vector<std::byte> data)
    : type_(type)
    , data_(std::move(data))
{
}


uint32_t
Chunk::length() const noexcept
{
    return static_cast<uint32_t>(data_.size());
}


uint32_t
Chunk::checksum() const noexcept
{
    const uint32_t crc = png_crc32(type_.bytes());
    return png_crc32_update(crc, data_);
}


uint64_t
Chunk::encoded_size() const noexcept
{
    return static_cast<uint64_t>(data_.size()) + kChunkOverheadBytes;
}


void
Chunk::encode(std::vector<std::byte>* out) const
{
    if (!out) {
        return;
    }
    out->reserve(out->size() + static_cast<size_t>(encoded_size()));
    append_u32be(out, length());
    out->insert(out->end(), type_.bytes().begin(), type_.bytes().end());
    out->insert(out->end(), data_.begin(), data_.end());
    append_u32be(out, checksum());
}


PngStatus
Chunk::data_as_text(std::string* out) const
{
    if (!text_internal::is_valid_utf8(data_)) {
        return PngStatus::InvalidEncoding;
    }
    if (out) {
        out->assign(reinterpret_cast<const char*>(data_.data()),
                    data_.size());
    }
    return PngStatus::Ok;
}


ChunkDecodeResult
decode_chunk(std::span<const std::byte> bytes, Chunk* out,
             const ChunkDecodeOptions& options)
{
    ChunkDecodeResult res;
    if (bytes.size() < kChunkOverheadBytes) {
        res.status = PngStatus::TruncatedInput;
        return res;
    }

    const uint32_t len = read_u32be(bytes, 0);
    if (len > kMaxChunkDataBytes) {
        res.status = PngStatus::InvalidLength;
        return res;
    }
    if (len > options.limits.max_chunk_bytes) {
        res.status = PngStatus::LimitExceeded;
        return res;
    }

    const uint64_t total = static_cast<uint64_t>(len) + kChunkOverheadBytes;
    if (total > static_cast<uint64_t>(bytes.size())) {
        res.status = PngStatus::TruncatedInput;
        return res;
    }

    const ChunkType type = ChunkType::from_bytes(bytes.subspan<4, 4>());
    const std::span<const std::byte> data = bytes.subspan(8, len);
    const uint32_t stored_crc = read_u32be(bytes, 8U + static_cast<size_t>(len));

    // CRC input is contiguous: type bytes are immediately followed by data.
    const uint32_t actual_crc = png_crc32(bytes.subspan(4, 4U + len));
    if (stored_crc != actual_crc) {
        res.status = PngStatus::ChecksumMismatch;
        return res;
    }

    if (out) {
        *out = Chunk(type, std::vector<std::byte>(data.begin(), data.end()));
    }
    res.consumed = total;
    return res;
}

}  // namespace pngchunk
