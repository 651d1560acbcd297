#include "pngchunk/build_info.h"

#include "pngchunk/build_info_generated.h"

#include <zlib.h>

namespace pngchunk {
namespace {

    static constexpr bool linkage_shared() noexcept
    {
#if defined(PNGCHUNK_BUILD_LINKAGE_SHARED) && PNGCHUNK_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/PNGCHUNK_BUILDINFO_VERSION,
        /*build_type=*/PNGCHUNK_BUILDINFO_BUILD_TYPE,
        /*system_name=*/PNGCHUNK_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/PNGCHUNK_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/PNGCHUNK_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/PNGCHUNK_BUILDINFO_CXX_COMPILER_VERSION,
        /*zlib=*/ZLIB_VERSION,
        /*linkage_shared=*/linkage_shared(),
    };


    static void append_sv(std::string* out, std::string_view s)
    {
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->clear();
        line1->append("pngchunk v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [zlib ");
        append_sv(line1, bi.zlib);
        line1->append("] ");
        line1->append(bi.linkage_shared ? "shared" : "static");
    }

    if (line2) {
        line2->clear();
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace pngchunk
