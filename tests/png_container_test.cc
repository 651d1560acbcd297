#include "pngchunk/png_container.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pngchunk {
namespace {

    static std::vector<std::byte> to_bytes(std::string_view s)
    {
        std::vector<std::byte> out;
        for (char c : s) {
            out.push_back(std::byte { static_cast<uint8_t>(c) });
        }
        return out;
    }


    static ChunkType type_of(std::string_view text)
    {
        ChunkType t;
        EXPECT_EQ(ChunkType::from_text(text, &t), PngStatus::Ok) << text;
        return t;
    }


    static Chunk make_chunk(std::string_view type, std::string_view data)
    {
        return Chunk(type_of(type), to_bytes(data));
    }


    // 1x1 RGB, 8-bit.
    static constexpr std::string_view kIhdrData("\x00\x00\x00\x01"
                                                "\x00\x00\x00\x01"
                                                "\x08\x02\x00\x00\x00",
                                                13);
    static constexpr std::string_view kTextData("Comment\0hello", 13);


    static std::vector<Chunk> sample_chunks()
    {
        std::vector<Chunk> chunks;
        chunks.push_back(make_chunk("IHDR", kIhdrData));
        chunks.push_back(make_chunk("tEXt", kTextData));
        chunks.push_back(make_chunk("RuSt", "This is where your secret "
                                            "message will be!"));
        chunks.push_back(make_chunk("IDAT", "\x78\x9c\x63\x60"));
        chunks.push_back(make_chunk("IEND", ""));
        return chunks;
    }


    static std::vector<std::byte>
    encode_stream(const std::vector<Chunk>& chunks)
    {
        std::vector<std::byte> out(kPngSignature.begin(), kPngSignature.end());
        for (const Chunk& c : chunks) {
            c.encode(&out);
        }
        return out;
    }


    TEST(PngContainer, ParseSampleStream)
    {
        const std::vector<std::byte> bytes = encode_stream(sample_chunks());
        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, PngDecodeOptions {});
        ASSERT_EQ(res.status, PngStatus::Ok);
        EXPECT_EQ(res.consumed, bytes.size());
        EXPECT_EQ(res.chunk_count, 5U);
        EXPECT_EQ(res.trailing_bytes, 0U);

        ASSERT_EQ(png.chunk_count(), 5U);
        EXPECT_EQ(png.chunks()[0].type(), kHeaderChunkType);
        EXPECT_EQ(png.chunks()[1].type().to_string(), "tEXt");
        EXPECT_EQ(png.chunks()[2].type().to_string(), "RuSt");
        EXPECT_EQ(png.chunks()[3].type().to_string(), "IDAT");
        EXPECT_EQ(png.chunks()[4].type(), kTerminatorChunkType);
        EXPECT_EQ(png.chunks()[0].length(), 13U);
        EXPECT_EQ(png.check_structure(), PngStatus::Ok);
    }


    TEST(PngContainer, SerializeRoundTrip)
    {
        const std::vector<std::byte> bytes = encode_stream(sample_chunks());
        PngContainer png;
        ASSERT_EQ(parse_png(bytes, &png, PngDecodeOptions {}).status,
                  PngStatus::Ok);

        const std::vector<std::byte> out = png.serialize();
        EXPECT_EQ(out, bytes);
        EXPECT_EQ(png.encoded_size(), out.size());

        PngContainer again;
        ASSERT_EQ(parse_png(out, &again, PngDecodeOptions {}).status,
                  PngStatus::Ok);
        EXPECT_EQ(again, png);
    }


    TEST(PngContainer, ProgrammaticContainerRoundTrips)
    {
        const PngContainer png(sample_chunks());
        PngContainer parsed;
        ASSERT_EQ(parse_png(png.serialize(), &parsed, PngDecodeOptions {})
                      .status,
                  PngStatus::Ok);
        EXPECT_EQ(parsed, png);
    }


    TEST(PngContainer, RejectsBadSignature)
    {
        std::vector<std::byte> bytes = encode_stream(sample_chunks());
        bytes[1] = std::byte { 'p' };
        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, PngDecodeOptions {});
        EXPECT_EQ(res.status, PngStatus::BadSignature);
        EXPECT_EQ(res.chunk_count, 0U);
        EXPECT_EQ(res.consumed, 0U);
        EXPECT_EQ(png.chunk_count(), 0U);
    }


    TEST(PngContainer, RejectsShortOrEmptyInput)
    {
        PngContainer png;
        EXPECT_EQ(parse_png({}, &png, PngDecodeOptions {}).status,
                  PngStatus::BadSignature);
        const std::span<const std::byte> partial(kPngSignature.data(), 5);
        EXPECT_EQ(parse_png(partial, &png, PngDecodeOptions {}).status,
                  PngStatus::BadSignature);
    }


    TEST(PngContainer, SignatureOnlyIsMissingTerminator)
    {
        PngContainer png;
        const PngParseResult res = parse_png(kPngSignature, &png,
                                             PngDecodeOptions {});
        EXPECT_EQ(res.status, PngStatus::MissingTerminator);
        EXPECT_EQ(res.chunk_count, 0U);
    }


    TEST(PngContainer, MissingTerminatorKeepsDecodedChunks)
    {
        std::vector<Chunk> chunks = sample_chunks();
        chunks.pop_back();
        const std::vector<std::byte> bytes = encode_stream(chunks);

        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, PngDecodeOptions {});
        EXPECT_EQ(res.status, PngStatus::MissingTerminator);
        EXPECT_EQ(res.chunk_count, 4U);
        EXPECT_EQ(res.consumed, bytes.size());
        ASSERT_EQ(png.chunk_count(), 4U);
        EXPECT_EQ(png.chunks()[3].type().to_string(), "IDAT");
    }


    TEST(PngContainer, ChecksumFailureStopsAtFailingChunk)
    {
        const std::vector<Chunk> chunks = sample_chunks();
        std::vector<std::byte> bytes = encode_stream(chunks);

        // Flip the last CRC byte of the third chunk (RuSt).
        const uint64_t rust_off = kPngSignatureSize + chunks[0].encoded_size()
                                  + chunks[1].encoded_size();
        const uint64_t rust_end = rust_off + chunks[2].encoded_size();
        bytes[static_cast<size_t>(rust_end - 1)] ^= std::byte { 0x80 };

        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, PngDecodeOptions {});
        EXPECT_EQ(res.status, PngStatus::ChecksumMismatch);
        EXPECT_EQ(res.consumed, rust_off);
        EXPECT_EQ(res.chunk_count, 2U);
        ASSERT_EQ(png.chunk_count(), 2U);
        EXPECT_EQ(png.chunks()[1].type().to_string(), "tEXt");
    }


    TEST(PngContainer, TruncatedChunkIsReported)
    {
        std::vector<std::byte> bytes = encode_stream(sample_chunks());
        bytes.resize(bytes.size() - 6);
        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, PngDecodeOptions {});
        EXPECT_EQ(res.status, PngStatus::TruncatedInput);
        EXPECT_EQ(res.chunk_count, 4U);
    }


    TEST(PngContainer, StopsAtTerminatorAndCountsTrailingBytes)
    {
        std::vector<std::byte> bytes = encode_stream(sample_chunks());
        const size_t png_size  = bytes.size();
        const std::vector<std::byte> extra = to_bytes("garbage!");
        bytes.insert(bytes.end(), extra.begin(), extra.end());

        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, PngDecodeOptions {});
        ASSERT_EQ(res.status, PngStatus::Ok);
        EXPECT_EQ(res.consumed, png_size);
        EXPECT_EQ(res.trailing_bytes, 8U);
        EXPECT_EQ(png.chunk_count(), 5U);
        EXPECT_EQ(png.serialize().size(), png_size);
    }


    TEST(PngContainer, HeaderRequirementIsConfigurable)
    {
        std::vector<Chunk> chunks;
        chunks.push_back(make_chunk("tEXt", std::string_view("k\0v", 3)));
        chunks.push_back(make_chunk("IEND", ""));
        const std::vector<std::byte> bytes = encode_stream(chunks);

        PngContainer png;
        const PngParseResult strict = parse_png(bytes, &png,
                                                PngDecodeOptions {});
        EXPECT_EQ(strict.status, PngStatus::MissingHeader);
        EXPECT_EQ(png.chunk_count(), 0U);

        PngDecodeOptions relaxed;
        relaxed.require_header_first = false;
        const PngParseResult res     = parse_png(bytes, &png, relaxed);
        ASSERT_EQ(res.status, PngStatus::Ok);
        EXPECT_EQ(png.chunk_count(), 2U);
        EXPECT_EQ(png.check_structure(), PngStatus::MissingHeader);
    }


    TEST(PngContainer, ChunkCountLimit)
    {
        const std::vector<std::byte> bytes = encode_stream(sample_chunks());
        PngDecodeOptions options;
        options.limits.max_chunks = 3;
        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, options);
        EXPECT_EQ(res.status, PngStatus::LimitExceeded);
        EXPECT_EQ(png.chunk_count(), 3U);
    }


    TEST(PngContainer, TotalPayloadLimit)
    {
        const std::vector<std::byte> bytes = encode_stream(sample_chunks());
        PngDecodeOptions options;
        options.limits.max_total_bytes = 20;
        PngContainer png;
        const PngParseResult res = parse_png(bytes, &png, options);
        EXPECT_EQ(res.status, PngStatus::LimitExceeded);
        EXPECT_EQ(png.chunk_count(), 1U);
    }


    TEST(PngContainer, RemoveByTypeRemovesFirstMatchOnly)
    {
        PngContainer png;
        png.append(make_chunk("AAAA", "first"));
        png.append(make_chunk("BBBB", "middle"));
        png.append(make_chunk("AAAA", "second"));

        Chunk removed;
        ASSERT_EQ(png.remove_by_type(type_of("AAAA"), &removed),
                  PngStatus::Ok);
        EXPECT_EQ(removed, make_chunk("AAAA", "first"));

        ASSERT_EQ(png.chunk_count(), 2U);
        EXPECT_EQ(png.chunks()[0].type().to_string(), "BBBB");
        EXPECT_EQ(png.chunks()[1], make_chunk("AAAA", "second"));

        EXPECT_EQ(png.find_by_type(type_of("CCCC")), nullptr);
        EXPECT_EQ(png.remove_by_type(type_of("CCCC"), &removed),
                  PngStatus::NotFound);
        EXPECT_EQ(png.chunk_count(), 2U);
    }


    TEST(PngContainer, FindByTypeReturnsFirstMatch)
    {
        PngContainer png(sample_chunks());
        png.append(make_chunk("RuSt", "later"));

        const Chunk* c = png.find_by_type(type_of("RuSt"));
        ASSERT_NE(c, nullptr);
        EXPECT_EQ(c, &png.chunks()[2]);

        // Lookup is exact: case matters.
        EXPECT_EQ(png.find_by_type(type_of("rust")), nullptr);
    }


    TEST(PngContainer, InsertBeforeTerminator)
    {
        PngContainer png(sample_chunks());
        png.insert_before_terminator(make_chunk("teSt", "note"));
        ASSERT_EQ(png.chunk_count(), 6U);
        EXPECT_EQ(png.chunks()[4].type().to_string(), "teSt");
        EXPECT_EQ(png.chunks()[5].type(), kTerminatorChunkType);
        EXPECT_EQ(png.check_structure(), PngStatus::Ok);

        PngContainer empty;
        empty.insert_before_terminator(make_chunk("teSt", "note"));
        EXPECT_EQ(empty.chunk_count(), 1U);
    }


    TEST(PngContainer, ChunksAfterTerminatorAreWrittenVerbatim)
    {
        PngContainer png(sample_chunks());
        png.append(make_chunk("teSt", "late"));
        EXPECT_EQ(png.check_structure(), PngStatus::TerminatorNotLast);

        const std::vector<std::byte> bytes = png.serialize();
        EXPECT_EQ(bytes.size(), png.encoded_size());

        // Parsing stops at IEND; the late chunk shows up as trailing data.
        PngContainer parsed;
        const PngParseResult res = parse_png(bytes, &parsed,
                                             PngDecodeOptions {});
        ASSERT_EQ(res.status, PngStatus::Ok);
        EXPECT_EQ(parsed.chunk_count(), 5U);
        EXPECT_EQ(res.trailing_bytes, 16U);
    }


    TEST(PngContainer, CheckStructure)
    {
        PngContainer png;
        EXPECT_EQ(png.check_structure(), PngStatus::MissingHeader);
        png.append(make_chunk("IHDR", "x"));
        EXPECT_EQ(png.check_structure(), PngStatus::MissingTerminator);
        png.append(make_chunk("IEND", ""));
        EXPECT_EQ(png.check_structure(), PngStatus::Ok);
        png.clear();
        EXPECT_EQ(png.chunk_count(), 0U);
    }


    TEST(PngStatusName, IsStable)
    {
        EXPECT_STREQ(png_status_name(PngStatus::Ok), "ok");
        EXPECT_STREQ(png_status_name(PngStatus::ChecksumMismatch),
                     "checksum_mismatch");
        EXPECT_STREQ(png_status_name(PngStatus::MissingTerminator),
                     "missing_terminator");
    }

}  // namespace
}  // namespace pngchunk
