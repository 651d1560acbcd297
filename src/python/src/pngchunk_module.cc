#include "pngchunk/build_info.h"
#include "pngchunk/console_format.h"
#include "pngchunk/png_container.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace pngchunk {
namespace {

    static std::span<const std::byte> py_bytes_span(const nb::bytes& b)
    {
        return std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                              b.c_str()),
                                          b.size());
    }


    static nb::bytes to_py_bytes(std::span<const std::byte> bytes)
    {
        return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size());
    }


    [[noreturn]] static void throw_status(const char* what, PngStatus status)
    {
        std::string msg(what);
        msg.append(": ");
        msg.append(png_status_name(status));
        throw nb::value_error(msg.c_str());
    }


    static ChunkType chunk_type_from_text(const std::string& text)
    {
        ChunkType t;
        const PngStatus st = ChunkType::from_text(text, &t);
        if (st != PngStatus::Ok) {
            throw_status("invalid chunk type", st);
        }
        return t;
    }


    static ChunkType chunk_type_from_bytes(const nb::bytes& raw)
    {
        if (raw.size() != 4U) {
            throw nb::value_error("chunk type needs exactly 4 bytes");
        }
        return ChunkType::from_bytes(py_bytes_span(raw).first<4>());
    }


    static Chunk make_chunk(const ChunkType& type, const nb::bytes& data)
    {
        const std::span<const std::byte> s = py_bytes_span(data);
        return Chunk(type, std::vector<std::byte>(s.begin(), s.end()));
    }


    static PngContainer parse_png_py(const nb::bytes& data,
                                     bool require_header_first,
                                     uint32_t max_chunks)
    {
        PngDecodeOptions options;
        options.require_header_first = require_header_first;
        options.limits.max_chunks    = max_chunks;

        // Resolve the buffer while the GIL is still held.
        const std::span<const std::byte> bytes = py_bytes_span(data);

        PngContainer png;
        PngParseResult res;
        {
            // parse_png does not touch the Python C API.
            nb::gil_scoped_release gil_release;
            res = parse_png(bytes, &png, options);
        }
        if (res.status != PngStatus::Ok) {
            throw_status("PNG parse failed", res.status);
        }
        return png;
    }


    static Chunk remove_chunk_py(PngContainer& png, const ChunkType& type)
    {
        Chunk removed;
        const PngStatus st = png.remove_by_type(type, &removed);
        if (st != PngStatus::Ok) {
            throw nb::key_error(type.to_string().c_str());
        }
        return removed;
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }

}  // namespace
}  // namespace pngchunk


NB_MODULE(_pngchunk, m)
{
    using namespace pngchunk;

    m.doc() = "PNG chunk reading/editing bindings (nanobind).";
    m.attr("__version__") = std::string(build_info().version);

    nb::enum_<PngStatus>(m, "PngStatus")
        .value("Ok", PngStatus::Ok)
        .value("BadSignature", PngStatus::BadSignature)
        .value("TruncatedInput", PngStatus::TruncatedInput)
        .value("ChecksumMismatch", PngStatus::ChecksumMismatch)
        .value("MissingTerminator", PngStatus::MissingTerminator)
        .value("MissingHeader", PngStatus::MissingHeader)
        .value("TerminatorNotLast", PngStatus::TerminatorNotLast)
        .value("InvalidFormat", PngStatus::InvalidFormat)
        .value("InvalidLength", PngStatus::InvalidLength)
        .value("InvalidEncoding", PngStatus::InvalidEncoding)
        .value("NotFound", PngStatus::NotFound)
        .value("LimitExceeded", PngStatus::LimitExceeded);

    nb::class_<ChunkType>(m, "ChunkType")
        .def(nb::new_(&chunk_type_from_text), "text"_a)
        .def_static("from_bytes", &chunk_type_from_bytes, "raw"_a)
        .def("bytes",
             [](const ChunkType& t) { return to_py_bytes(t.bytes()); })
        .def("is_valid", &ChunkType::is_valid)
        .def("is_critical", &ChunkType::is_critical)
        .def("is_public", &ChunkType::is_public)
        .def("is_reserved_bit_valid", &ChunkType::is_reserved_bit_valid)
        .def("is_safe_to_copy", &ChunkType::is_safe_to_copy)
        .def("__str__", &ChunkType::to_string)
        .def("__repr__",
             [](const ChunkType& t) {
                 return "ChunkType('" + t.to_string() + "')";
             })
        .def("__eq__", [](const ChunkType& a,
                          const ChunkType& b) { return a == b; })
        .def("__hash__", &ChunkType::fourcc);

    nb::class_<Chunk>(m, "Chunk")
        .def(nb::new_(&make_chunk), "chunk_type"_a, "data"_a)
        .def_prop_ro("chunk_type", &Chunk::type)
        .def_prop_ro("data",
                     [](const Chunk& c) { return to_py_bytes(c.data()); })
        .def("length", &Chunk::length)
        .def("crc", &Chunk::checksum)
        .def("data_as_text",
             [](const Chunk& c) {
                 std::string out;
                 const PngStatus st = c.data_as_text(&out);
                 if (st != PngStatus::Ok) {
                     throw_status("chunk data", st);
                 }
                 return out;
             })
        .def("as_bytes",
             [](const Chunk& c) {
                 std::vector<std::byte> out;
                 c.encode(&out);
                 return to_py_bytes(out);
             })
        .def("summary",
             [](const Chunk& c, uint32_t max_preview) {
                 std::string out;
                 append_chunk_summary(c, max_preview, &out);
                 return out;
             },
             "max_preview"_a = 32U)
        .def("__eq__",
             [](const Chunk& a, const Chunk& b) { return a == b; });

    nb::class_<PngContainer>(m, "PngContainer")
        .def(nb::init<>())
        .def("chunks",
             [](const PngContainer& png) {
                 const std::span<const Chunk> c = png.chunks();
                 return std::vector<Chunk>(c.begin(), c.end());
             })
        .def("__len__", &PngContainer::chunk_count)
        .def("append_chunk", &PngContainer::append, "chunk"_a)
        .def("insert_chunk", &PngContainer::insert_before_terminator,
             "chunk"_a)
        .def("remove_chunk", &remove_chunk_py, "chunk_type"_a)
        .def("chunk_by_type",
             [](const PngContainer& png, const ChunkType& type) -> nb::object {
                 const Chunk* c = png.find_by_type(type);
                 if (!c) {
                     return nb::none();
                 }
                 return nb::cast(*c);
             },
             "chunk_type"_a)
        .def("check_structure", &PngContainer::check_structure)
        .def("as_bytes",
             [](const PngContainer& png) {
                 return to_py_bytes(png.serialize());
             });

    m.def("parse_png", &parse_png_py, "data"_a,
          "require_header_first"_a = true, "max_chunks"_a = 1U << 16);
    m.def(
        "crc32",
        [](const nb::bytes& data) { return png_crc32(py_bytes_span(data)); },
        "data"_a);
    m.def("build_info_lines", &info_lines);
}
