#include "pngchunk/build_info.h"
#include "pngchunk/console_format.h"
#include "pngchunk/file_io.h"
#include "pngchunk/png_container.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace pngchunk {
namespace {

    static void usage(const char* argv0)
    {
        const char* name = argv0 ? argv0 : "pngchunk";
        std::printf(
            "Usage: %s [options] encode <file> <type> <message> [output]\n"
            "       %s [options] decode <file> <type>\n"
            "       %s [options] remove <file> <type>\n"
            "       %s [options] print <file>\n"
            "\n"
            "Reads and edits PNG chunks without touching image data.\n"
            "\n"
            "Commands:\n"
            "  encode   Insert a <type> chunk carrying <message> before IEND\n"
            "           (writes to [output], default: in place)\n"
            "  decode   Print the first <type> chunk's payload as text\n"
            "           (control and non-ASCII bytes print as \\xNN)\n"
            "  remove   Remove the first <type> chunk and rewrite <file>\n"
            "  print    List all chunks\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print pngchunk build info\n"
            "  --max-file-bytes N     Refuse files larger than N bytes (default: 0=unlimited)\n"
            "  --max-chunks N         Max chunks decoded per file (default: 65536)\n"
            "  --max-preview N        Payload preview bytes for print (default: 32)\n"
            "  --no-require-ihdr      Accept streams whose first chunk is not IHDR\n",
            name, name, name, name);
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    struct ToolConfig final {
        uint64_t max_file_bytes = 0;
        uint32_t max_preview    = 32U;
        PngDecodeOptions decode;
    };


    static bool load_png(const ToolConfig& cfg, const char* path,
                         PngContainer* png)
    {
        std::vector<std::byte> bytes;
        const FileIoStatus io = read_file_bytes(path, cfg.max_file_bytes,
                                                &bytes);
        if (io != FileIoStatus::Ok) {
            std::fprintf(stderr, "%s: read failed (%s)\n", path,
                         file_io_status_name(io));
            return false;
        }

        const PngParseResult res = parse_png(bytes, png, cfg.decode);
        if (res.status != PngStatus::Ok) {
            std::fprintf(stderr,
                         "%s: parse failed (%s) at offset %llu after %u "
                         "chunk(s)\n",
                         path, png_status_name(res.status),
                         static_cast<unsigned long long>(res.consumed),
                         static_cast<unsigned>(res.chunk_count));
            return false;
        }
        if (res.trailing_bytes != 0U) {
            std::fprintf(stderr, "%s: ignoring %llu byte(s) after IEND\n",
                         path,
                         static_cast<unsigned long long>(res.trailing_bytes));
        }
        return true;
    }


    static bool save_png(const PngContainer& png, const char* path)
    {
        const std::vector<std::byte> bytes = png.serialize();
        const FileIoStatus io = write_file_bytes(path, bytes);
        if (io != FileIoStatus::Ok) {
            std::fprintf(stderr, "%s: write failed (%s)\n", path,
                         file_io_status_name(io));
            return false;
        }
        return true;
    }


    static bool parse_type_arg(const char* s, ChunkType* out)
    {
        const PngStatus st = ChunkType::from_text(s ? s : "", out);
        if (st != PngStatus::Ok) {
            std::fprintf(stderr, "invalid chunk type '%s' (%s)\n",
                         s ? s : "", png_status_name(st));
            return false;
        }
        return true;
    }


    static int cmd_encode(const ToolConfig& cfg, const char* path,
                          const char* type_arg, const char* message,
                          const char* out_path)
    {
        ChunkType type;
        if (!parse_type_arg(type_arg, &type)) {
            return 2;
        }
        if (!type.is_valid()) {
            std::fprintf(stderr, "chunk type '%s' has the reserved bit set\n",
                         type_arg);
            return 2;
        }

        PngContainer png;
        if (!load_png(cfg, path, &png)) {
            return 1;
        }

        const std::string_view text(message ? message : "");
        const std::byte* p = reinterpret_cast<const std::byte*>(text.data());
        png.insert_before_terminator(
            Chunk(type, std::vector<std::byte>(p, p + text.size())));

        return save_png(png, out_path ? out_path : path) ? 0 : 1;
    }


    static int cmd_decode(const ToolConfig& cfg, const char* path,
                          const char* type_arg)
    {
        ChunkType type;
        if (!parse_type_arg(type_arg, &type)) {
            return 2;
        }
        PngContainer png;
        if (!load_png(cfg, path, &png)) {
            return 1;
        }

        const Chunk* chunk = png.find_by_type(type);
        if (!chunk) {
            std::fprintf(stderr, "%s: no %s chunk\n", path,
                         type.to_string().c_str());
            return 1;
        }

        std::string text;
        const PngStatus st = chunk->data_as_text(&text);
        if (st != PngStatus::Ok) {
            std::fprintf(stderr, "%s: %s chunk is not text (%s)\n", path,
                         type.to_string().c_str(), png_status_name(st));
            return 1;
        }

        std::string line;
        append_console_text(text, 0, &line);
        std::printf("%s\n", line.c_str());
        return 0;
    }


    static int cmd_remove(const ToolConfig& cfg, const char* path,
                          const char* type_arg)
    {
        ChunkType type;
        if (!parse_type_arg(type_arg, &type)) {
            return 2;
        }
        PngContainer png;
        if (!load_png(cfg, path, &png)) {
            return 1;
        }

        Chunk removed;
        const PngStatus st = png.remove_by_type(type, &removed);
        if (st != PngStatus::Ok) {
            std::fprintf(stderr, "%s: cannot remove %s (%s)\n", path,
                         type.to_string().c_str(), png_status_name(st));
            return 1;
        }
        if (!save_png(png, path)) {
            return 1;
        }

        std::string line;
        append_chunk_summary(removed, cfg.max_preview, &line);
        std::printf("removed %s\n", line.c_str());
        return 0;
    }


    static int cmd_print(const ToolConfig& cfg, const char* path)
    {
        PngContainer png;
        if (!load_png(cfg, path, &png)) {
            return 1;
        }

        std::printf("%s: %u chunk(s)\n", path,
                    static_cast<unsigned>(png.chunk_count()));
        const std::span<const Chunk> chunks = png.chunks();
        std::string line;
        for (size_t i = 0; i < chunks.size(); ++i) {
            line.clear();
            append_chunk_summary(chunks[i], cfg.max_preview, &line);
            std::printf("  [%zu] %s\n", i, line.c_str());
        }
        return 0;
    }

}  // namespace
}  // namespace pngchunk


int
main(int argc, char** argv)
{
    using namespace pngchunk;

    ToolConfig cfg;
    std::vector<const char*> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-require-ihdr") == 0) {
            cfg.decode.require_header_first = false;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &cfg.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-chunks") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &cfg.decode.limits.max_chunks)) {
                std::fprintf(stderr, "invalid --max-chunks value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-preview") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &cfg.max_preview)) {
                std::fprintf(stderr, "invalid --max-preview value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] == '-') {
            std::fprintf(stderr, "unknown option: %s\n", arg);
            return 2;
        }
        positional.push_back(arg);
    }

    if (positional.empty()) {
        usage(argv[0]);
        return 2;
    }

    const std::string_view cmd(positional[0]);
    const size_t nargs = positional.size() - 1U;
    if (cmd == "encode" && (nargs == 3U || nargs == 4U)) {
        return cmd_encode(cfg, positional[1], positional[2], positional[3],
                          nargs == 4U ? positional[4] : nullptr);
    }
    if (cmd == "decode" && nargs == 2U) {
        return cmd_decode(cfg, positional[1], positional[2]);
    }
    if (cmd == "remove" && nargs == 2U) {
        return cmd_remove(cfg, positional[1], positional[2]);
    }
    if (cmd == "print" && nargs == 1U) {
        return cmd_print(cfg, positional[1]);
    }

    usage(argv[0]);
    return 2;
}
