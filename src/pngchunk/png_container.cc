#include "pngchunk/png_container.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace pngchunk {
namespace {

    static bool has_signature(std::span<const std::byte> bytes) noexcept
    {
        if (bytes.size() < kPngSignatureSize) {
            return false;
        }
        return std::memcmp(bytes.data(), kPngSignature.data(),
                           kPngSignatureSize)
               == 0;
    }

}  // namespace

PngContainer::PngContainer(std::vector<Chunk> chunks)
    : chunks_(std::move(chunks))
{
}


uint32_t
PngContainer::chunk_count() const noexcept
{
    return static_cast<uint32_t>(chunks_.size());
}


void
PngContainer::append(Chunk chunk)
{
    chunks_.push_back(std::move(chunk));
}


void
PngContainer::insert_before_terminator(Chunk chunk)
{
    const auto it = std::find_if(chunks_.begin(), chunks_.end(),
                                 [](const Chunk& c) {
                                     return c.type() == kTerminatorChunkType;
                                 });
    chunks_.insert(it, std::move(chunk));
}


PngStatus
PngContainer::remove_by_type(const ChunkType& type, Chunk* removed)
{
    for (auto it = chunks_.begin(); it != chunks_.end(); ++it) {
        if (it->type() != type) {
            continue;
        }
        if (removed) {
            *removed = std::move(*it);
        }
        chunks_.erase(it);
        return PngStatus::Ok;
    }
    return PngStatus::NotFound;
}


const Chunk*
PngContainer::find_by_type(const ChunkType& type) const noexcept
{
    for (size_t i = 0; i < chunks_.size(); ++i) {
        if (chunks_[i].type() == type) {
            return &chunks_[i];
        }
    }
    return nullptr;
}


void
PngContainer::clear() noexcept
{
    chunks_.clear();
}


PngStatus
PngContainer::check_structure() const noexcept
{
    if (chunks_.empty() || chunks_.front().type() != kHeaderChunkType) {
        return PngStatus::MissingHeader;
    }
    for (size_t i = 0; i < chunks_.size(); ++i) {
        if (chunks_[i].type() != kTerminatorChunkType) {
            continue;
        }
        return (i + 1U == chunks_.size()) ? PngStatus::Ok
                                          : PngStatus::TerminatorNotLast;
    }
    return PngStatus::MissingTerminator;
}


uint64_t
PngContainer::encoded_size() const noexcept
{
    uint64_t size = kPngSignatureSize;
    for (size_t i = 0; i < chunks_.size(); ++i) {
        size += chunks_[i].encoded_size();
    }
    return size;
}


void
PngContainer::serialize(std::vector<std::byte>* out) const
{
    if (!out) {
        return;
    }
    out->reserve(out->size() + static_cast<size_t>(encoded_size()));
    out->insert(out->end(), kPngSignature.begin(), kPngSignature.end());
    for (size_t i = 0; i < chunks_.size(); ++i) {
        chunks_[i].encode(out);
    }
}


std::vector<std::byte>
PngContainer::serialize() const
{
    std::vector<std::byte> out;
    serialize(&out);
    return out;
}


PngParseResult
parse_png(std::span<const std::byte> bytes, PngContainer* out,
          const PngDecodeOptions& options)
{
    PngParseResult res;
    if (out) {
        out->clear();
    }

    if (!has_signature(bytes)) {
        res.status = PngStatus::BadSignature;
        return res;
    }

    ChunkDecodeOptions chunk_options;
    chunk_options.limits = options.limits;

    const uint64_t max_total = options.limits.max_total_bytes;
    uint64_t payload_total   = 0;
    uint64_t offset          = kPngSignatureSize;
    res.consumed             = offset;

    while (offset < bytes.size()) {
        if (res.chunk_count >= options.limits.max_chunks) {
            res.status = PngStatus::LimitExceeded;
            return res;
        }

        Chunk chunk;
        const ChunkDecodeResult dec
            = decode_chunk(bytes.subspan(static_cast<size_t>(offset)), &chunk,
                           chunk_options);
        if (dec.status != PngStatus::Ok) {
            res.status = dec.status;
            return res;
        }

        if (res.chunk_count == 0U && options.require_header_first
            && chunk.type() != kHeaderChunkType) {
            res.status = PngStatus::MissingHeader;
            return res;
        }

        payload_total += chunk.length();
        if (max_total != 0U && payload_total > max_total) {
            res.status = PngStatus::LimitExceeded;
            return res;
        }

        const bool is_terminator = chunk.type() == kTerminatorChunkType;
        if (out) {
            out->append(std::move(chunk));
        }
        res.chunk_count += 1;
        offset += dec.consumed;
        res.consumed = offset;

        if (is_terminator) {
            res.trailing_bytes = static_cast<uint64_t>(bytes.size()) - offset;
            return res;
        }
    }

    res.status = PngStatus::MissingTerminator;
    return res;
}

}  // namespace pngchunk
